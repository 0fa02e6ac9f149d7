#pragma once

/// @file component.hpp
/// @brief Base class for units of behavior attached to an Actor.

#include "ark/scene/capability.hpp"
#include "ark/scene/handle.hpp"

#include <cstdint>
#include <string>

namespace ark::scene {

class Actor;
class SceneManager;

/// A polymorphic unit of behavior owned by exactly one Actor.
///
/// Components are created through Actor::AddComponent<T>(), which passes
/// the owning actor as the first constructor argument:
///
/// @code
///   class Spinner : public Component {
///   public:
///       explicit Spinner(Actor& actor)
///           : Component(actor, "Spinner", Capability::Update) {}
///       void OnUpdate(double dt) override { angle += dt; }
///       double angle = 0.0;
///   };
///
///   auto& spinner = actor.AddComponent<Spinner>();
/// @endcode
///
/// Only hooks named in the capability set are invoked.  Hooks run on the
/// kernel thread and exceptions thrown from them propagate to the caller
/// of the frame.
class Component {
public:
    Component(Actor& actor, std::string typeName, Capability capabilities = Capability::None);
    virtual ~Component() = default;

    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;
    Component(Component&&) = delete;
    Component& operator=(Component&&) = delete;

    // ── Lifecycle hooks ─────────────────────────────────────────────

    /// First hook, run during the start flush after the component's
    /// dependencies were wired.
    virtual void OnAttach() {}

    /// Runs once, after every component of the same start batch attached.
    virtual void OnStart() {}

    virtual void OnUpdate(double /*deltaMs*/) {}

    virtual void OnFixedUpdate(double /*stepMs*/) {}

    /// Runs exactly once when the component or its actor is torn down.
    virtual void OnDestroy() {}

    virtual void OnLayerChange(bool /*active*/) {}

    // ── Accessors ───────────────────────────────────────────────────

    [[nodiscard]] Actor& GetActor() const noexcept { return *actor_; }
    [[nodiscard]] const std::string& TypeName() const noexcept { return typeName_; }
    [[nodiscard]] Capability Capabilities() const noexcept { return capabilities_; }
    [[nodiscard]] bool Has(Capability flag) const noexcept {
        return hasCapability(capabilities_, flag);
    }

    [[nodiscard]] uint64_t Id() const noexcept { return id_; }
    [[nodiscard]] const std::string& PersistentId() const noexcept { return persistentId_; }
    [[nodiscard]] ComponentHandle GetHandle() const noexcept { return handle_; }

    [[nodiscard]] bool IsStarted() const noexcept { return started_; }
    [[nodiscard]] bool IsDestroyed() const noexcept { return destroyed_; }
    [[nodiscard]] bool IsPendingForDestruction() const noexcept { return pendingForDestruction_; }

    /// True once Actor::RemoveComponent() took the component off its actor.
    [[nodiscard]] bool IsDetached() const noexcept { return detached_; }

    /// Request destruction of this component alone (see SceneManager::DestroyComponent).
    void Destroy();

    /// "TypeName:id-persistentId".
    [[nodiscard]] std::string ToString() const;

private:
    friend class Actor;
    friend class SceneManager;

    /// Runs immediately before OnAttach; Behavior wires its dependencies here.
    virtual void PrepareAttach() {}

    /// Call OnDestroy unless it already ran.
    void RunDestroy();

    Actor* actor_;
    SceneManager* manager_;
    std::string typeName_;
    Capability capabilities_;

    uint64_t id_ = 0;
    std::string persistentId_;
    ComponentHandle handle_;

    bool attached_ = false;
    bool started_ = false;
    bool destroyed_ = false;
    bool pendingForDestruction_ = false;
    bool detached_ = false;
};

} // namespace ark::scene
