#pragma once

/// @file timer.hpp
/// @brief Tick-counting timer for periodic work inside hooks.

#include <cstdint>
#include <functional>

namespace ark::runtime {

struct TimerOptions {
    /// Count ticks from construction; otherwise wait for start().
    bool autoStart = true;

    /// Keep firing every interval; otherwise stop after the first fire.
    bool loop = true;

    std::function<void()> callback;
};

/// Fires a callback every @c interval calls to walk().
///
/// Driven by the caller once per tick (typically from OnUpdate or
/// OnFixedUpdate), so it follows frames, not wall-clock time.  An
/// interval of 0 or 1 fires on every walk.  Exceptions thrown by the
/// callback propagate out of walk() after the counter was reset.
///
/// Example:
/// @code
///   Timer blink(30, {.callback = [this] { toggle(); }});
///   void OnFixedUpdate(double) override { blink.walk(); }
/// @endcode
class Timer {
public:
    static constexpr uint32_t kDefaultInterval = 60;

    explicit Timer(uint32_t interval = kDefaultInterval, TimerOptions options = {});

    /// (Re)start counting.  Does not reset the tick counter.
    void start() noexcept { started_ = true; }

    /// Count one tick.
    /// @return true if the callback ran on this tick.
    bool walk();

    [[nodiscard]] bool isStarted() const noexcept { return started_; }
    [[nodiscard]] uint32_t interval() const noexcept { return interval_; }
    [[nodiscard]] bool loops() const noexcept { return loop_; }

    void setInterval(uint32_t interval) noexcept { interval_ = interval; }
    void setLoop(bool loop) noexcept { loop_ = loop; }

private:
    uint32_t interval_;
    bool loop_;
    bool started_;
    uint32_t tick_ = 1;
    std::function<void()> callback_;
};

} // namespace ark::runtime
