#pragma once

/// @file actor_tree.hpp
/// @brief Ordered container of actors with lookup, glob query and
///        two-phase destruction.

#include "ark/foundation/signal.hpp"
#include "ark/scene/actor_query.hpp"
#include "ark/scene/handle.hpp"

#include <string_view>
#include <vector>

namespace ark::scene {

class Actor;
class SceneManager;

/// One step of a depth-first walk.  @c parent is nullptr for roots of the
/// scene.
struct ActorTreeNode {
    Actor* actor = nullptr;
    Actor* parent = nullptr;
};

/// A list of child actors and the queries over the hierarchy below it.
///
/// The scene root is an ActorTree and so is every Actor (for its own
/// children).  Children are held by handle; the actors themselves live in
/// the SceneManager's arena.
///
/// Lookups never fail loudly: a miss is nullptr or an empty range.
/// Destruction here only marks actors pending; the SceneManager removes
/// them at the end of the frame (SceneManager::Reap).
class ActorTree {
public:
    ActorTree(SceneManager& manager, Actor* owner);
    virtual ~ActorTree() = default;

    ActorTree(const ActorTree&) = delete;
    ActorTree& operator=(const ActorTree&) = delete;

    // ── Membership ──────────────────────────────────────────────────

    /// Append @p actor as a direct child and fire ActorAdded.
    void Add(Actor& actor);

    /// Remove @p actor if it is a direct child and fire ActorRemoved.
    /// No-op otherwise.
    void Remove(Actor& actor);

    [[nodiscard]] bool Contains(const Actor& actor) const noexcept;

    // ── Lookup ──────────────────────────────────────────────────────

    /// Find an actor by exact name (depth-first, first hit) or by
    /// '/'-separated path.
    ///
    /// For a path the first segment is searched like a name, each further
    /// segment must be a direct child.  Actors pending destruction are
    /// skipped at every step.
    [[nodiscard]] Actor* GetActor(std::string_view nameOrPath) const;

    /// Lazy glob query; see ActorQuery.
    [[nodiscard]] ActorQuery GetActors(std::string_view pattern) const;

    /// Direct children not pending destruction.
    [[nodiscard]] std::vector<Actor*> GetRootActors() const;

    /// Every actor below this tree in depth-first order, including actors
    /// pending destruction.
    [[nodiscard]] std::vector<Actor*> GetAllActors() const;

    // ── Destruction (mark only) ─────────────────────────────────────

    void DestroyActor(Actor& actor);
    void DestroyAllActors();

    // ── Traversal ───────────────────────────────────────────────────

    /// Depth-first (actor, parent) pairs for the whole tree.
    [[nodiscard]] std::vector<ActorTreeNode> Walk() const;

    /// Depth-first (actor, parent) pairs below @p node, excluding @p node.
    [[nodiscard]] std::vector<ActorTreeNode> WalkFromNode(const Actor& node) const;

    /// Visit depth-first (pre-order) without building a list.
    ///
    /// @p visit receives (Actor&, Actor* parent) and returns false to skip
    /// the actor's subtree.  Children are snapshotted before descending.
    template <typename Visitor>
    void Visit(Visitor&& visit) const;

    // ── Accessors ───────────────────────────────────────────────────

    [[nodiscard]] const std::vector<ActorHandle>& ChildHandles() const noexcept { return children_; }
    [[nodiscard]] std::size_t ChildCount() const noexcept { return children_.size(); }

    [[nodiscard]] SceneManager& Manager() const noexcept { return *manager_; }

    /// The Actor whose children this is, or nullptr for the scene root.
    [[nodiscard]] Actor* Owner() const noexcept { return owner_; }

    [[nodiscard]] foundation::Signal<Actor&>& ActorAdded() noexcept { return added_; }
    [[nodiscard]] foundation::Signal<Actor&>& ActorRemoved() noexcept { return removed_; }

private:
    [[nodiscard]] Actor* Resolve(ActorHandle handle) const noexcept;
    [[nodiscard]] Actor* FindByName(std::string_view name) const;
    [[nodiscard]] Actor* FindByPath(std::string_view path) const;

    template <typename Visitor>
    void VisitNode(Actor& actor, Actor* parent, Visitor& visit) const;

    SceneManager* manager_;
    Actor* owner_;
    std::vector<ActorHandle> children_;
    foundation::Signal<Actor&> added_;
    foundation::Signal<Actor&> removed_;
};

} // namespace ark::scene
