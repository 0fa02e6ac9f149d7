#pragma once

/// @file actor_query.hpp
/// @brief Lazy, restartable glob query over an actor hierarchy.

#include "ark/scene/handle.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace ark::scene {

class Actor;
class ActorTree;
class SceneManager;

/// Range of actors matching a name or path pattern.
///
/// Nothing is evaluated until begin() is called, and every call to begin()
/// starts a fresh traversal of the tree as it is at that moment, so a
/// query object can be kept and iterated again after the hierarchy changed.
///
/// A pattern without '/' is a single glob tested against every
/// non-pending actor in depth-first order.  A pattern with '/' is matched
/// level by level from the tree's direct children; a `**` segment spans
/// zero or more levels.
///
/// @code
///   for (Actor* leaf : scene.Tree().GetActors("root/**/group/*/leaf")) {
///       leaf->MarkDestructionPending();
///   }
/// @endcode
///
/// Results are depth-first, then sibling-insertion order.  Actors pending
/// destruction, and everything below them, are never yielded.
class ActorQuery {
public:
    ActorQuery(const ActorTree& tree, std::string pattern);

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Actor*;
        using difference_type = std::ptrdiff_t;
        using reference = Actor*;
        using pointer = Actor**;

        Iterator() = default;

        [[nodiscard]] Actor* operator*() const noexcept { return current_; }

        Iterator& operator++();
        void operator++(int) { ++*this; }

        friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept {
            return it.current_ == nullptr;
        }

    private:
        friend class ActorQuery;

        enum class Step : uint8_t {
            Walk,    ///< flat glob: test this actor, then its children
            Match,   ///< test this actor against segment N
            Descend, ///< inside `**` at segment N: test against N+1, keep descending
            Emit     ///< trailing `**`: yield this actor and all descendants
        };

        struct Task {
            Step step;
            ActorHandle actor;
            std::size_t segment;
        };

        struct Plan;

        explicit Iterator(std::shared_ptr<const Plan> plan);

        void pushChildren(const Actor& actor, Step step, std::size_t segment);
        void advance();

        std::shared_ptr<const Plan> plan_;
        std::vector<Task> stack_;
        Actor* current_ = nullptr;
    };

    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    [[nodiscard]] const std::string& Pattern() const noexcept { return pattern_; }

    /// First match, or nullptr.
    [[nodiscard]] Actor* First() const;

    /// Evaluate the whole query.
    [[nodiscard]] std::vector<Actor*> ToVector() const;

    [[nodiscard]] std::size_t Count() const;

private:
    const ActorTree* tree_;
    std::string pattern_;
    std::shared_ptr<const Iterator::Plan> plan_;
};

} // namespace ark::scene
