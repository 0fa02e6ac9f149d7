/// @file actor_tree.cpp
/// @brief ActorTree membership, lookup and traversal.

#include "ark/scene/actor_tree.hpp"

#include "ark/scene/actor.hpp"
#include "ark/scene/name_pattern.hpp"
#include "ark/scene/scene_manager.hpp"

#include <algorithm>
#include <string>

namespace ark::scene {

ActorTree::ActorTree(SceneManager& manager, Actor* owner)
    : manager_(&manager), owner_(owner) {}

// ── Membership ───────────────────────────────────────────────────────

void ActorTree::Add(Actor& actor) {
    children_.push_back(actor.GetHandle());
    added_.emit(actor);
}

void ActorTree::Remove(Actor& actor) {
    auto it = std::find(children_.begin(), children_.end(), actor.GetHandle());
    if (it == children_.end()) {
        return;
    }
    children_.erase(it);
    removed_.emit(actor);
}

bool ActorTree::Contains(const Actor& actor) const noexcept {
    return std::find(children_.begin(), children_.end(), actor.GetHandle()) != children_.end();
}

// ── Lookup ───────────────────────────────────────────────────────────

Actor* ActorTree::GetActor(std::string_view nameOrPath) const {
    if (isPath(nameOrPath)) {
        return FindByPath(nameOrPath);
    }
    return FindByName(nameOrPath);
}

ActorQuery ActorTree::GetActors(std::string_view pattern) const {
    return ActorQuery(*this, std::string(pattern));
}

std::vector<Actor*> ActorTree::GetRootActors() const {
    std::vector<Actor*> out;
    out.reserve(children_.size());
    for (const auto handle : children_) {
        auto* actor = Resolve(handle);
        if (actor != nullptr && !actor->IsPendingForDestruction()) {
            out.push_back(actor);
        }
    }
    return out;
}

std::vector<Actor*> ActorTree::GetAllActors() const {
    std::vector<Actor*> out;
    Visit([&out](Actor& actor, Actor*) {
        out.push_back(&actor);
        return true;
    });
    return out;
}

Actor* ActorTree::FindByName(std::string_view name) const {
    Actor* found = nullptr;
    Visit([&](Actor& actor, Actor*) {
        if (found != nullptr || actor.IsPendingForDestruction()) {
            return false;
        }
        if (actor.Name() == name) {
            found = &actor;
            return false;
        }
        return true;
    });
    return found;
}

Actor* ActorTree::FindByPath(std::string_view path) const {
    const auto parts = splitPath(path);
    if (parts.empty()) {
        return nullptr;
    }

    Actor* current = FindByName(parts.front());
    for (std::size_t i = 1; i < parts.size() && current != nullptr; ++i) {
        Actor* next = nullptr;
        for (const auto handle : current->ChildHandles()) {
            auto* child = Resolve(handle);
            if (child != nullptr && !child->IsPendingForDestruction() &&
                child->Name() == parts[i]) {
                next = child;
                break;
            }
        }
        current = next;
    }
    return current;
}

// ── Destruction (mark only) ──────────────────────────────────────────

void ActorTree::DestroyActor(Actor& actor) {
    if (!actor.IsPendingForDestruction()) {
        actor.MarkDestructionPending();
    }
}

void ActorTree::DestroyAllActors() {
    for (auto* actor : GetAllActors()) {
        DestroyActor(*actor);
    }
}

// ── Traversal ────────────────────────────────────────────────────────

std::vector<ActorTreeNode> ActorTree::Walk() const {
    std::vector<ActorTreeNode> out;
    Visit([&out](Actor& actor, Actor* parent) {
        out.push_back({&actor, parent});
        return true;
    });
    return out;
}

std::vector<ActorTreeNode> ActorTree::WalkFromNode(const Actor& node) const {
    return node.Walk();
}

Actor* ActorTree::Resolve(ActorHandle handle) const noexcept {
    return manager_->Resolve(handle);
}

} // namespace ark::scene
