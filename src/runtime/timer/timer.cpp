/// @file timer.cpp
/// @brief Timer implementation.

#include "ark/runtime/timer.hpp"

#include <utility>

namespace ark::runtime {

Timer::Timer(uint32_t interval, TimerOptions options)
    : interval_(interval),
      loop_(options.loop),
      started_(options.autoStart),
      callback_(std::move(options.callback)) {}

bool Timer::walk() {
    if (!started_) {
        return false;
    }
    if (tick_ < interval_) {
        ++tick_;
        return false;
    }

    if (!loop_) {
        started_ = false;
    }
    tick_ = 1;
    if (callback_) {
        callback_();
    }
    return true;
}

} // namespace ark::runtime
