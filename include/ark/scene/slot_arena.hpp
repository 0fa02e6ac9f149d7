#pragma once

/// @file slot_arena.hpp
/// @brief Flat owning store addressed by versioned handles.

#include "ark/scene/handle.hpp"

#include <cassert>
#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

namespace ark::scene {

/// Owns heap objects in numbered slots and hands out versioned handles.
///
/// Released slots are recycled oldest-first with an incremented version,
/// which invalidates every handle that still points at the old occupant.
/// Objects never move once inserted, so raw pointers obtained from Get()
/// stay valid until the slot is released.
///
/// @tparam T   Stored (possibly polymorphic) type.
/// @tparam Tag Handle family.
template <typename T, typename Tag>
class SlotArena {
public:
    using HandleType = Handle<Tag>;

    SlotArena() = default;

    SlotArena(const SlotArena&) = delete;
    SlotArena& operator=(const SlotArena&) = delete;
    SlotArena(SlotArena&&) noexcept = default;
    SlotArena& operator=(SlotArena&&) noexcept = default;

    // ── Lifecycle ───────────────────────────────────────────────────

    /// Take ownership of @p object and return its handle.
    [[nodiscard]] HandleType Insert(std::unique_ptr<T> object) {
        uint32_t index = 0;

        if (!freeList_.empty()) {
            // Recycle the oldest released slot (FIFO).
            index = freeList_.front();
            freeList_.pop_front();
        } else {
            index = static_cast<uint32_t>(objects_.size());
            assert(index <= HandleType::kMaxIndex && "arena index space exhausted");
            objects_.emplace_back();
            versions_.push_back(0);
        }

        objects_[index] = std::move(object);
        ++count_;
        return HandleType(index, versions_[index]);
    }

    /// Remove the object behind @p handle and hand ownership back.
    ///
    /// Returns nullptr for a stale or invalid handle.  The slot version is
    /// incremented (wrapping at 255) before the slot is recycled.
    std::unique_ptr<T> Release(HandleType handle) {
        if (!IsAlive(handle)) {
            return nullptr;
        }
        const auto idx = handle.index();
        auto object = std::move(objects_[idx]);
        versions_[idx] = static_cast<uint8_t>(versions_[idx] + 1);
        freeList_.push_back(idx);
        --count_;
        return object;
    }

    // ── Queries ─────────────────────────────────────────────────────

    /// Resolve @p handle, or nullptr when it no longer refers to a live slot.
    [[nodiscard]] T* Get(HandleType handle) const noexcept {
        return IsAlive(handle) ? objects_[handle.index()].get() : nullptr;
    }

    [[nodiscard]] bool IsAlive(HandleType handle) const noexcept {
        if (!handle.isValid()) {
            return false;
        }
        const auto idx = handle.index();
        if (idx >= objects_.size()) {
            return false;
        }
        return objects_[idx] != nullptr && versions_[idx] == handle.version();
    }

    /// Number of live objects.
    [[nodiscard]] std::size_t Count() const noexcept { return count_; }

    /// Number of slots ever allocated, including recycled ones.
    [[nodiscard]] std::size_t Capacity() const noexcept { return objects_.size(); }

private:
    std::vector<std::unique_ptr<T>> objects_;
    std::vector<uint8_t> versions_;
    std::deque<uint32_t> freeList_;
    std::size_t count_ = 0;
};

} // namespace ark::scene
