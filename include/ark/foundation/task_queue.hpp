#pragma once

/// @file task_queue.hpp
/// @brief Deferred-callback queue drained on the kernel thread.

#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace ark::foundation {

/// FIFO queue of deferred tasks.
///
/// post() may be called from any thread (loader continuations, host input);
/// drain() is called by the kernel thread at a frame boundary and runs
/// tasks there, never concurrently with hierarchy mutation.
///
/// Example:
/// @code
///   TaskQueue tasks;
///   tasks.post([&] { assets.flush(); });
///   tasks.drain();  // runs the flush
/// @endcode
class TaskQueue {
public:
    using Task = std::function<void()>;

    TaskQueue() = default;

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /// Queue a task for the next drain().
    void post(Task task);

    /// Run queued tasks in FIFO order until the queue is empty.
    ///
    /// Tasks posted by a running task are run by the same drain() call,
    /// after everything queued before them.
    /// @return Number of tasks run.
    std::size_t drain();

    /// Number of tasks waiting.
    [[nodiscard]] std::size_t pending() const;

    /// Drop all waiting tasks without running them.
    void clear();

private:
    std::vector<Task> queue_;
    mutable std::mutex mutex_;
};

} // namespace ark::foundation
