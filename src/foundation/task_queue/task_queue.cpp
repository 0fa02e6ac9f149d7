#include "ark/foundation/task_queue.hpp"

#include <utility>

namespace ark::foundation {

void TaskQueue::post(Task task) {
    if (!task) {
        return;
    }
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(task));
}

std::size_t TaskQueue::drain() {
    std::size_t ran = 0;
    for (;;) {
        std::vector<Task> batch;
        {
            std::lock_guard lock(mutex_);
            batch.swap(queue_);
        }
        if (batch.empty()) {
            return ran;
        }
        for (auto& task : batch) {
            task();
            ++ran;
        }
    }
}

std::size_t TaskQueue::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void TaskQueue::clear() {
    std::lock_guard lock(mutex_);
    queue_.clear();
}

} // namespace ark::foundation
