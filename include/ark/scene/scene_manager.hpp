#pragma once

/// @file scene_manager.hpp
/// @brief Owner of all actors and components; start flush, per-frame
///        dispatch and the end-of-frame reap.

#include "ark/foundation/id_generator.hpp"
#include "ark/foundation/kernel_result.hpp"
#include "ark/scene/actor.hpp"
#include "ark/scene/actor_tree.hpp"
#include "ark/scene/component.hpp"
#include "ark/scene/handle.hpp"
#include "ark/scene/slot_arena.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ark::scene {

using ActorArena = SlotArena<Actor, ActorTag>;
using ComponentArena = SlotArena<Component, ComponentTag>;

/// Counters reported by SceneManager::Reap().
struct ReapStats {
    std::size_t components = 0; ///< individually destroyed components
    std::size_t actors = 0;     ///< actors detached and destroyed
};

/// Owns the hierarchy of one world.
///
/// Every actor and component lives in one of the two arenas; lists
/// (children, components, start queue, per-frame cache) hold handles.
///
/// The host drives one frame as:
/// @code
///   scenes.FlushStarts();
///   for (each fixed step) scenes.FixedUpdate(step);
///   scenes.Update(delta);
///   scenes.Reap();
/// @endcode
///
/// Destruction requested during FixedUpdate or Update only flags records;
/// nothing is removed before Reap().
class SceneManager {
public:
    SceneManager();
    ~SceneManager();

    SceneManager(const SceneManager&) = delete;
    SceneManager& operator=(const SceneManager&) = delete;

    // ── Actors ──────────────────────────────────────────────────────

    /// Create an actor under @p parent (nullptr = scene root).
    ///
    /// Fails with InvalidArgument for an empty name and with
    /// ActorPendingDestruction if @p parent is pending.
    foundation::KernelResult<Actor*> CreateActor(std::string name,
                                                  Actor* parent = nullptr,
                                                  ActorOptions options = {});

    /// The scene root.
    [[nodiscard]] ActorTree& Tree() noexcept { return tree_; }
    [[nodiscard]] const ActorTree& Tree() const noexcept { return tree_; }

    /// Shorthand for Tree().GetActor().
    [[nodiscard]] Actor* GetActor(std::string_view nameOrPath) const { return tree_.GetActor(nameOrPath); }

    [[nodiscard]] Actor* Resolve(ActorHandle handle) const noexcept { return actors_.Get(handle); }
    [[nodiscard]] Component* Resolve(ComponentHandle handle) const noexcept { return components_.Get(handle); }

    // ── Components ──────────────────────────────────────────────────

    /// Schedule @p component for destruction at the next Reap().
    ///
    /// Idempotent.  The component is removed from the start queue at once
    /// and stops receiving updates; OnDestroy runs during Reap(), before
    /// any actor is reaped.
    void DestroyComponent(Component& component);

    // ── Frame phases ────────────────────────────────────────────────

    /// Start every component waiting in the start queue, in creation order.
    ///
    /// Each batch runs in two passes: dependency wiring and OnAttach for
    /// the whole batch, then OnStart for the whole batch.  Components
    /// created by those hooks form the next batch of the same call.
    /// Also snapshots the actors that FixedUpdate() and Update() visit.
    /// @return Number of components started.
    std::size_t FlushStarts();

    void FixedUpdate(double stepMs);
    void Update(double deltaMs);

    /// Remove everything flagged for destruction: individually destroyed
    /// components first, then pending actors in depth-first order (detach
    /// from the parent, then Actor::Destroy()).
    ReapStats Reap();

    /// Mark every actor pending; they are removed by the next Reap().
    void DestroyAllActors() { tree_.DestroyAllActors(); }

    // ── Introspection ───────────────────────────────────────────────

    [[nodiscard]] std::size_t ActorCount() const noexcept { return actors_.Count(); }
    [[nodiscard]] std::size_t ComponentCount() const noexcept { return components_.Count(); }
    [[nodiscard]] std::size_t PendingStartCount() const noexcept { return toBeStarted_.size(); }

private:
    friend class Actor;

    [[nodiscard]] ComponentHandle InsertComponent(std::unique_ptr<Component> component);
    void EnqueueStart(ComponentHandle handle);
    void DequeueStart(ComponentHandle handle);

    /// Park a detached component until the next reap releases it.
    void AdoptOrphan(ComponentHandle handle);

    /// Release storage of a component whose actor has been destroyed.
    void ReleaseComponent(ComponentHandle handle);

    ActorArena actors_;
    ComponentArena components_;
    ActorTree tree_;

    std::vector<ComponentHandle> toBeStarted_;
    std::vector<ComponentHandle> toBeDestroyed_;
    std::vector<ComponentHandle> orphans_;
    std::vector<ActorHandle> cachedActors_;

    foundation::SequenceIdGenerator actorIds_;
    foundation::SequenceIdGenerator componentIds_;
    foundation::PersistentIdGenerator persistentIds_;
};

} // namespace ark::scene
