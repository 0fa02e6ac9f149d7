/// @file actor_query.cpp
/// @brief Depth-first glob evaluation with an explicit task stack.

#include "ark/scene/actor_query.hpp"

#include "ark/scene/actor.hpp"
#include "ark/scene/actor_tree.hpp"
#include "ark/scene/name_pattern.hpp"
#include "ark/scene/scene_manager.hpp"

#include <utility>

namespace ark::scene {

struct ActorQuery::Iterator::Plan {
    const ActorTree* tree = nullptr;
    std::string pattern;
    bool isPath = false;
    std::vector<std::string> segments;
};

ActorQuery::ActorQuery(const ActorTree& tree, std::string pattern)
    : tree_(&tree), pattern_(std::move(pattern)) {
    auto plan = std::make_shared<Iterator::Plan>();
    plan->tree = tree_;
    plan->pattern = pattern_;
    plan->isPath = isPath(pattern_);
    if (plan->isPath) {
        plan->segments = splitPath(pattern_);
    }
    plan_ = std::move(plan);
}

ActorQuery::Iterator ActorQuery::begin() const {
    return Iterator(plan_);
}

Actor* ActorQuery::First() const {
    auto it = begin();
    return *it;
}

std::vector<Actor*> ActorQuery::ToVector() const {
    std::vector<Actor*> out;
    for (auto* actor : *this) {
        out.push_back(actor);
    }
    return out;
}

std::size_t ActorQuery::Count() const {
    std::size_t n = 0;
    for (auto it = begin(); it != end(); ++it) {
        ++n;
    }
    return n;
}

// ── Iterator ─────────────────────────────────────────────────────────

ActorQuery::Iterator::Iterator(std::shared_ptr<const Plan> plan)
    : plan_(std::move(plan)) {
    const auto& roots = plan_->tree->ChildHandles();
    if (plan_->isPath && plan_->segments.empty()) {
        return;
    }
    const Step first = plan_->isPath ? Step::Match : Step::Walk;
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        stack_.push_back({first, *it, 0});
    }
    advance();
}

ActorQuery::Iterator& ActorQuery::Iterator::operator++() {
    advance();
    return *this;
}

void ActorQuery::Iterator::pushChildren(const Actor& actor, Step step, std::size_t segment) {
    // Reverse push so the first child is popped first.
    const auto& children = actor.ChildHandles();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        stack_.push_back({step, *it, segment});
    }
}

void ActorQuery::Iterator::advance() {
    const auto& manager = plan_->tree->Manager();
    const auto& segments = plan_->segments;

    while (!stack_.empty()) {
        const Task task = stack_.back();
        stack_.pop_back();

        Actor* actor = manager.Resolve(task.actor);
        // A pending actor hides its whole subtree.
        if (actor == nullptr || actor->IsPendingForDestruction()) {
            continue;
        }

        switch (task.step) {
            case Step::Walk:
                pushChildren(*actor, Step::Walk, 0);
                if (matchName(plan_->pattern, actor->Name())) {
                    current_ = actor;
                    return;
                }
                break;

            case Step::Emit:
                pushChildren(*actor, Step::Emit, 0);
                current_ = actor;
                return;

            case Step::Match: {
                const auto& segment = segments[task.segment];
                const bool last = task.segment + 1 == segments.size();
                if (isRecursiveWildcard(segment)) {
                    stack_.push_back({last ? Step::Emit : Step::Descend, task.actor, task.segment});
                    break;
                }
                if (!matchName(segment, actor->Name())) {
                    break;
                }
                if (last) {
                    current_ = actor;
                    return;
                }
                pushChildren(*actor, Step::Match, task.segment + 1);
                break;
            }

            case Step::Descend: {
                // Keep scanning below this actor once its own matches are done.
                pushChildren(*actor, Step::Descend, task.segment);
                const std::size_t next = task.segment + 1;
                if (!matchName(segments[next], actor->Name())) {
                    break;
                }
                if (next + 1 == segments.size()) {
                    current_ = actor;
                    return;
                }
                pushChildren(*actor, Step::Match, next + 1);
                break;
            }
        }
    }
    current_ = nullptr;
}

} // namespace ark::scene
