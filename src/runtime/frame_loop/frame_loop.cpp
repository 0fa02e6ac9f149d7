/// @file frame_loop.cpp
/// @brief FrameLoop implementation.

#include "ark/runtime/frame_loop.hpp"

#include "ark/foundation/kernel_logger.hpp"

#include <string>

namespace ark::runtime {

using foundation::ErrorCode;
using foundation::KernelError;
using foundation::KernelResult;
using foundation::LogCategory;

namespace {

constexpr uint32_t kDefaultFps = 60;

std::chrono::microseconds frameTimeFor(uint32_t fps) {
    return std::chrono::microseconds(1'000'000 / fps);
}

} // namespace

FrameLoop::FrameLoop(World& world)
    : FrameLoop(world, world.config().fps) {}

FrameLoop::FrameLoop(World& world, uint32_t fps)
    : world_(world),
      fps_(fps > 0 ? fps : kDefaultFps),
      targetFrameTime_(frameTimeFor(fps > 0 ? fps : kDefaultFps)) {}

FrameLoop::~FrameLoop() {
    stop();
}

void FrameLoop::setMetricsCallback(MetricsCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    metricsCallback_ = std::move(callback);
}

KernelResult<void> FrameLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return KernelResult<void>::err(
            KernelError(ErrorCode::LoopAlreadyRunning, "frame loop is already running"));
    }
    // A previous thread that ended on its frame limit is still joinable.
    if (thread_.joinable()) {
        thread_.join();
    }

    ARK_LOG_INFO(LogCategory::Runtime, "frame loop started at " + std::to_string(fps_) + " fps");
    thread_ = std::thread([this] { run(frameLimit_.load()); });
    return KernelResult<void>::ok();
}

void FrameLoop::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void FrameLoop::wait() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

KernelResult<uint64_t> FrameLoop::runFrames(uint64_t frames) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return KernelResult<uint64_t>::err(
            KernelError(ErrorCode::LoopAlreadyRunning, "frame loop is already running"));
    }
    const auto before = frameCount_.load();
    run(frames);
    return KernelResult<uint64_t>::ok(frameCount_.load() - before);
}

FrameMetrics FrameLoop::tick(double deltaMs) {
    return executeFrame(std::chrono::microseconds(static_cast<int64_t>(deltaMs * 1000.0)));
}

bool FrameLoop::isRunning() const noexcept {
    return running_.load();
}

FrameMetrics FrameLoop::lastMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return lastMetrics_;
}

void FrameLoop::run(uint64_t limit) {
    auto nextFrame = std::chrono::steady_clock::now();
    auto lastFrame = nextFrame - targetFrameTime_;
    uint64_t executed = 0;

    while (running_.load() && (limit == 0 || executed < limit)) {
        nextFrame += targetFrameTime_;

        const auto frameStart = std::chrono::steady_clock::now();
        const auto delta =
            std::chrono::duration_cast<std::chrono::microseconds>(frameStart - lastFrame);
        lastFrame = frameStart;

        executeFrame(delta);
        ++executed;

        // Sleep until next frame, but skip if we already overran.
        auto now = std::chrono::steady_clock::now();
        if (now < nextFrame) {
            std::this_thread::sleep_until(nextFrame);
        } else {
            // Overrun: reset the target to avoid cascading catch-up.
            nextFrame = now;
        }
    }

    running_.store(false);
    ARK_LOG_INFO(LogCategory::Runtime,
                 "frame loop stopped after " + std::to_string(executed) + " frame(s)");
}

FrameMetrics FrameLoop::executeFrame(std::chrono::microseconds delta) {
    const auto frameStart = std::chrono::steady_clock::now();

    const auto frame = world_.tick(static_cast<double>(delta.count()) / 1000.0);

    const auto updateDuration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - frameStart);

    FrameMetrics metrics;
    metrics.updateTime = updateDuration;
    metrics.frameTime = delta;
    metrics.budgetUtilization =
        targetFrameTime_.count() > 0
            ? static_cast<float>(updateDuration.count()) /
                  static_cast<float>(targetFrameTime_.count())
            : 0.0f;
    metrics.frameNumber = frameCount_.fetch_add(1);
    metrics.overrun = updateDuration > targetFrameTime_;
    metrics.fixedUpdates = frame.updates;
    metrics.rendered = frame.rendered;

    // Store metrics for external queries.
    {
        std::lock_guard<std::mutex> lock(metricsMutex_);
        lastMetrics_ = metrics;
    }

    // Notify metrics observer.
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        if (metricsCallback_) {
            metricsCallback_(metrics);
        }
    }
    return metrics;
}

} // namespace ark::runtime
