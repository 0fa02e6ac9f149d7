#pragma once

/// @file actor.hpp
/// @brief Actor: a node of the scene hierarchy that owns components.

#include "ark/foundation/kernel_result.hpp"
#include "ark/foundation/signal.hpp"
#include "ark/scene/actor_tree.hpp"
#include "ark/scene/component.hpp"
#include "ark/scene/handle.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ark::scene {

class Behavior;
class SceneManager;

/// Creation options for SceneManager::CreateActor.
struct ActorOptions {
    bool visible = true;
    std::vector<uint32_t> layers;
};

/// A node of the hierarchy: identity, placement, components, children.
///
/// Actors are created by SceneManager::CreateActor() and live in its arena;
/// the parent keeps only a handle.  Destruction is two-phase:
/// MarkDestructionPending() flags the actor and its subtree, and the
/// SceneManager detaches and destroys flagged actors at the end of the
/// frame.  From the moment an actor is pending it is invisible to every
/// query except GetAllActors().
class Actor : public ActorTree {
public:
    ~Actor() override = default;

    // ── Identity ────────────────────────────────────────────────────

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] uint64_t Id() const noexcept { return id_; }
    [[nodiscard]] const std::string& PersistentId() const noexcept { return persistentId_; }
    [[nodiscard]] ActorHandle GetHandle() const noexcept { return handle_; }

    /// "name:id-persistentId".
    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] bool IsVisible() const noexcept { return visible_; }
    void SetVisible(bool visible) noexcept { visible_ = visible; }

    [[nodiscard]] const std::vector<uint32_t>& Layers() const noexcept { return layers_; }
    [[nodiscard]] bool InLayer(uint32_t layer) const noexcept;

    // ── Placement ───────────────────────────────────────────────────

    /// Parent actor, or nullptr for a root actor.
    [[nodiscard]] Actor* Parent() const noexcept;

    /// Move this actor under @p newParent (nullptr = scene root), appended
    /// after the new siblings.
    ///
    /// Fails with ActorPendingDestruction if either actor is pending, and
    /// with InvalidArgument if @p newParent is this actor or one of its
    /// descendants.
    foundation::KernelResult<void> SetParent(Actor* newParent);

    // ── Components ──────────────────────────────────────────────────

    /// Construct a T(*this, args...) and attach it.
    ///
    /// The component is appended to the component list and to the start
    /// queue; its hooks run from the next SceneManager::FlushStarts().
    template <typename T, typename... Args>
    T& AddComponent(Args&&... args);

    /// Like AddComponent(), then calls @p init with the new component
    /// before any lifecycle hook can run.
    template <typename T, typename Init, typename... Args>
    T& AddComponentWith(Init&& init, Args&&... args);

    /// First live component of type T (dynamic type), or nullptr.
    template <typename T>
    [[nodiscard]] T* GetComponent() const;

    /// First live component whose TypeName() equals @p typeName, or nullptr.
    [[nodiscard]] Component* GetComponent(std::string_view typeName) const;

    /// Every live component of type T in attach order.
    template <typename T>
    [[nodiscard]] std::vector<T*> GetComponents() const;

    /// All attached components in attach order, including pending ones.
    [[nodiscard]] std::vector<Component*> Components() const;

    [[nodiscard]] std::size_t ComponentCount() const noexcept { return components_.size(); }

    /// Behaviors registered under @p typeName, in attach order.
    [[nodiscard]] std::vector<Behavior*> GetBehaviors(std::string_view typeName) const;

    /// Detach @p component from this actor without calling OnDestroy.
    /// Its storage is released at the next reap.
    /// @return false if @p component is not attached here.
    bool RemoveComponent(Component& component);

    // ── Per-frame work ──────────────────────────────────────────────

    /// Run OnUpdate on started components of the per-frame list.
    /// No-op while pending destruction.
    void Update(double deltaMs);

    /// Run OnFixedUpdate on started components of the per-frame list.
    /// No-op while pending destruction.
    void FixedUpdate(double stepMs);

    /// Tell every component whether the given layer is active for this
    /// actor (std::nullopt activates all layers).
    void SetActiveLayer(std::optional<uint32_t> layer);

    // ── Destruction ─────────────────────────────────────────────────

    /// Flag this actor and, depth-first, its whole subtree.  Idempotent.
    void MarkDestructionPending();

    [[nodiscard]] bool IsPendingForDestruction() const noexcept { return pendingForDestruction_; }
    [[nodiscard]] bool IsDestroyed() const noexcept { return destroyed_; }

    /// Tear down all components: OnDestroy in reverse attach order, exactly
    /// once each, then clear the component lists.  Runs at most once.
    /// Components attached by the hooks get OnDestroy as well; components
    /// attached afterwards never start and are freed at the next reap.
    ///
    /// Called by the SceneManager when it reaps the actor.
    void Destroy();

    /// Fires once, when the actor becomes pending destruction.
    [[nodiscard]] foundation::Signal<Actor&>& DestructionPending() noexcept { return destructionPending_; }

private:
    friend class SceneManager;

    Actor(SceneManager& manager, std::string name, uint64_t id,
          std::string persistentId, ActorOptions options);

    /// Store @p component in the arena and register it on every list.
    void AttachComponent(std::unique_ptr<Component> component);

    /// Drop @p handle from the component, per-frame and behavior lists.
    void DetachComponent(ComponentHandle handle);

    [[nodiscard]] Component* ResolveComponent(ComponentHandle handle) const noexcept;

    std::string name_;
    uint64_t id_;
    std::string persistentId_;
    ActorHandle handle_;
    ActorHandle parent_;

    bool visible_;
    std::vector<uint32_t> layers_;

    std::vector<ComponentHandle> components_;
    std::vector<ComponentHandle> componentsRequiringUpdate_;
    std::unordered_map<std::string, std::vector<ComponentHandle>> behaviors_;

    bool pendingForDestruction_ = false;
    bool destroyed_ = false;
    bool tearingDown_ = false;
    foundation::Signal<Actor&> destructionPending_;
};

// --- Template implementations ---

template <typename T, typename... Args>
T& Actor::AddComponent(Args&&... args) {
    return AddComponentWith<T>([](T&) {}, std::forward<Args>(args)...);
}

template <typename T, typename Init, typename... Args>
T& Actor::AddComponentWith(Init&& init, Args&&... args) {
    static_assert(std::is_base_of_v<Component, T>, "T must derive from Component");
    auto owned = std::make_unique<T>(*this, std::forward<Args>(args)...);
    T& component = *owned;
    AttachComponent(std::move(owned));
    std::forward<Init>(init)(component);
    return component;
}

template <typename T>
T* Actor::GetComponent() const {
    for (const auto handle : components_) {
        auto* component = ResolveComponent(handle);
        if (component == nullptr || component->IsPendingForDestruction()) {
            continue;
        }
        if (auto* typed = dynamic_cast<T*>(component)) {
            return typed;
        }
    }
    return nullptr;
}

template <typename T>
std::vector<T*> Actor::GetComponents() const {
    std::vector<T*> out;
    for (const auto handle : components_) {
        auto* component = ResolveComponent(handle);
        if (component == nullptr || component->IsPendingForDestruction()) {
            continue;
        }
        if (auto* typed = dynamic_cast<T*>(component)) {
            out.push_back(typed);
        }
    }
    return out;
}

template <typename Visitor>
void ActorTree::Visit(Visitor&& visit) const {
    const auto roots = children_;
    for (const auto handle : roots) {
        if (auto* actor = Resolve(handle)) {
            VisitNode(*actor, owner_, visit);
        }
    }
}

template <typename Visitor>
void ActorTree::VisitNode(Actor& actor, Actor* parent, Visitor& visit) const {
    if (!visit(actor, parent)) {
        return;
    }
    const auto children = actor.ChildHandles();
    for (const auto handle : children) {
        if (auto* child = Resolve(handle)) {
            VisitNode(*child, &actor, visit);
        }
    }
}

} // namespace ark::scene
