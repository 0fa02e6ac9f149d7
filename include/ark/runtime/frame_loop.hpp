#pragma once

/// @file frame_loop.hpp
/// @brief Host loop driving a World at a target frame rate.
///
/// FrameLoop calls World::tick() at the configured rate (default 60 Hz)
/// on a dedicated thread, passing the wall-clock time measured between
/// frames.  Each frame reports how long the tick took, how much of the
/// frame budget it used, and whether it overran.

#include "ark/foundation/kernel_result.hpp"
#include "ark/runtime/world.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace ark::runtime {

/// Per-frame performance metrics.
struct FrameMetrics {
    /// Time spent in World::tick().
    std::chrono::microseconds updateTime{0};

    /// Wall-clock delta handed to World::tick().
    std::chrono::microseconds frameTime{0};

    /// Ratio of updateTime to the frame budget (1.0 = full budget).
    float budgetUtilization = 0.0f;

    /// Monotonically increasing frame counter (starts at 0).
    uint64_t frameNumber = 0;

    /// True when updateTime exceeded the frame budget.
    bool overrun = false;

    /// Fixed steps run by the frame.
    uint32_t fixedUpdates = 0;

    /// True when the frame was drawn.
    bool rendered = false;
};

/// Frame loop with a dedicated thread.
///
/// While the loop runs, its thread is the kernel thread: other threads
/// talk to the World only through World::tasks().
///
/// Usage:
/// @code
///   World world(config);
///   FrameLoop loop(world);
///   loop.setMetricsCallback([](const FrameMetrics& m) {
///       if (m.overrun) { ... }
///   });
///   loop.start();
///   // ...
///   loop.stop();
/// @endcode
class FrameLoop {
public:
    using MetricsCallback = std::function<void(const FrameMetrics&)>;

    /// Loop at the World's configured fps.
    explicit FrameLoop(World& world);

    /// Loop at @p fps frames per second (0 falls back to 60).
    FrameLoop(World& world, uint32_t fps);

    ~FrameLoop();

    // Non-copyable, non-movable (owns a thread).
    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;
    FrameLoop(FrameLoop&&) = delete;
    FrameLoop& operator=(FrameLoop&&) = delete;

    /// Set an optional callback invoked after each frame with metrics.
    void setMetricsCallback(MetricsCallback callback);

    /// Stop on its own after @p frames more frames (0 = no limit).
    void setFrameLimit(uint64_t frames) noexcept { frameLimit_.store(frames); }

    /// Start the loop on a dedicated thread.
    /// Fails with LoopAlreadyRunning if it is running.
    foundation::KernelResult<void> start();

    /// Signal the loop to stop and wait for the thread to join.
    void stop();

    /// Block until the thread exits (after stop() or the frame limit).
    void wait();

    /// Run @p frames frames on the calling thread at the target rate.
    /// Fails with LoopAlreadyRunning if the thread is running.
    foundation::KernelResult<uint64_t> runFrames(uint64_t frames);

    /// Execute a single frame manually with @p deltaMs (for testing).
    ///
    /// The loop must not be running on a thread when calling this.
    /// @return The metrics for the executed frame.
    FrameMetrics tick(double deltaMs);

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] uint32_t fps() const noexcept { return fps_; }
    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept { return targetFrameTime_; }
    [[nodiscard]] uint64_t frameCount() const noexcept { return frameCount_.load(); }

    /// Get the metrics from the last completed frame.
    [[nodiscard]] FrameMetrics lastMetrics() const;

private:
    /// Loop body shared by the thread and runFrames().
    void run(uint64_t limit);

    /// Execute one frame and publish its metrics.
    FrameMetrics executeFrame(std::chrono::microseconds delta);

    World& world_;
    uint32_t fps_;
    std::chrono::microseconds targetFrameTime_;

    MetricsCallback metricsCallback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> frameCount_{0};
    std::atomic<uint64_t> frameLimit_{0};
    std::thread thread_;

    mutable std::mutex metricsMutex_;
    FrameMetrics lastMetrics_;

    mutable std::mutex callbackMutex_;
};

} // namespace ark::runtime
