#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> for observer hooks.
///
/// Slots are registered via connect() and invoked in connection order when
/// emit() is called. emit() works on a snapshot, so a slot may connect or
/// disconnect slots (including itself) while the signal is firing.

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace ark::foundation {

/// Thread-safe signal (observer pattern) that dispatches events to registered
/// callbacks.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<Actor&> onAdded;
///   auto id = onAdded.connect([](Actor& actor) {
///       std::cout << actor.Name() << " added\n";
///   });
///   onAdded.emit(actor);
///   onAdded.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    // Non-copyable. Movable with custom move (std::shared_mutex is not movable).
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    Signal(Signal&& other) noexcept {
        std::unique_lock lock(other.mutex_);
        slots_ = std::move(other.slots_);
        nextId_.store(other.nextId_.load(std::memory_order_relaxed),
                      std::memory_order_relaxed);
    }

    Signal& operator=(Signal&& other) noexcept {
        if (this != &other) {
            // Lock both, always in address order to prevent deadlock
            auto* first = this < &other ? this : &other;
            auto* second = this < &other ? &other : this;
            std::unique_lock lock1(first->mutex_);
            std::unique_lock lock2(second->mutex_);
            slots_ = std::move(other.slots_);
            nextId_.store(other.nextId_.load(std::memory_order_relaxed),
                          std::memory_order_relaxed);
        }
        return *this;
    }

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    /// Remove a previously registered callback by its SlotId.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        slots_.erase(std::remove_if(slots_.begin(), slots_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     slots_.end());
    }

    /// Fire the signal, invoking every slot registered at the time of the call.
    void emit(Args... args) const {
        // Snapshot under the shared lock, invoke outside it.
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& entry : slots_) {
                snapshot.push_back(entry.second);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

    void disconnectAll() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    std::vector<std::pair<SlotId, Slot>> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace ark::foundation
