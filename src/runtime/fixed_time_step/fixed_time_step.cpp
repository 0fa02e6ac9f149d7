/// @file fixed_time_step.cpp
/// @brief FixedTimeStep implementation.

#include "ark/runtime/fixed_time_step.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace ark::runtime {

using foundation::ErrorCode;
using foundation::KernelError;
using foundation::KernelResult;

namespace {

uint32_t clampFps(uint32_t fps) noexcept {
    return std::clamp(fps, FixedTimeStep::kMinFramesPerSecond,
                      FixedTimeStep::kMaxFramesPerSecond);
}

} // namespace

FixedTimeStep::FixedTimeStep(double stepMs, uint32_t fps) noexcept
    : stepMs_(stepMs), fps_(fps) {}

KernelResult<FixedTimeStep> FixedTimeStep::create(double stepMs) {
    if (!std::isfinite(stepMs) || stepMs <= 0.0) {
        return KernelResult<FixedTimeStep>::err(
            KernelError(ErrorCode::InvalidTimeStep,
                        "fixed step must be positive, got " + std::to_string(stepMs)));
    }
    auto fps = static_cast<uint32_t>(std::clamp(std::lround(1000.0 / stepMs), 1L,
                                                static_cast<long>(kMaxFramesPerSecond)));
    return KernelResult<FixedTimeStep>::ok(FixedTimeStep(stepMs, fps));
}

FixedTimeStep FixedTimeStep::fromFramesPerSecond(uint32_t fps) {
    const auto clamped = clampFps(fps);
    return FixedTimeStep(1000.0 / clamped, clamped);
}

TickResult FixedTimeStep::tick(double rawDeltaMs, const FixedUpdateFn& fixedUpdate) {
    if (rawDeltaMs > 0.0 && std::isfinite(rawDeltaMs)) {
        accumulator_ += rawDeltaMs;
        idle_ = false;
    }

    TickResult result;
    while (accumulator_ + kStepEpsilonMs >= stepMs_) {
        if (fixedUpdate) {
            fixedUpdate(stepMs_);
        }
        accumulator_ = std::max(0.0, accumulator_ - stepMs_);
        ++result.updates;
        ++totalUpdates_;
    }
    result.timeLeft = accumulator_;
    return result;
}

TickResult FixedTimeStep::tickAt(double timestampMs, const FixedUpdateFn& fixedUpdate) {
    if (!lastTimestamp_) {
        lastTimestamp_ = timestampMs;
        return TickResult{0, accumulator_};
    }
    const double delta = timestampMs - *lastTimestamp_;
    lastTimestamp_ = timestampMs;
    return tick(delta, fixedUpdate);
}

double FixedTimeStep::interpolation() const noexcept {
    return std::clamp(accumulator_ / stepMs_, 0.0, 1.0);
}

void FixedTimeStep::reset() noexcept {
    accumulator_ = 0.0;
    lastTimestamp_.reset();
    idle_ = true;
}

void FixedTimeStep::setFixedFramesPerSecond(uint32_t fps) noexcept {
    fps_ = clampFps(fps);
    stepMs_ = 1000.0 / fps_;
}

} // namespace ark::runtime
