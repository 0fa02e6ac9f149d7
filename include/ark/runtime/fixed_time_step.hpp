#pragma once

/// @file fixed_time_step.hpp
/// @brief Converts variable frame deltas into fixed logical steps.

#include "ark/foundation/kernel_result.hpp"

#include <cstdint>
#include <functional>
#include <optional>

namespace ark::runtime {

/// Outcome of one FixedTimeStep::tick().
struct TickResult {
    /// Fixed steps run by this tick.  Zero means nothing needs drawing.
    uint32_t updates = 0;

    /// Unconsumed time carried to the next tick, in milliseconds.
    double timeLeft = 0.0;
};

/// Fixed-step accumulator.
///
/// Time handed to tick() is accumulated; every whole step in the
/// accumulator runs the fixed-update callback once.  The number of steps
/// depends only on the total time fed in, not on how it was split across
/// calls.  A step that is short of completion by less than kStepEpsilonMs
/// counts as complete, so that steps like 1000/60 ms add up exactly.
///
/// The accumulator is not clamped here: callers cap large deltas before
/// calling tick() (see runtime::World).
class FixedTimeStep {
public:
    using FixedUpdateFn = std::function<void(double stepMs)>;

    static constexpr uint32_t kMinFramesPerSecond = 1;
    static constexpr uint32_t kMaxFramesPerSecond = 240;
    static constexpr double kStepEpsilonMs = 1e-6;

    /// Create a scheduler with a step of @p stepMs milliseconds.
    /// Fails with InvalidTimeStep unless the step is finite and positive.
    [[nodiscard]] static foundation::KernelResult<FixedTimeStep> create(double stepMs);

    /// Create a scheduler running @p fps steps per second, clamped to
    /// [kMinFramesPerSecond, kMaxFramesPerSecond].
    [[nodiscard]] static FixedTimeStep fromFramesPerSecond(uint32_t fps);

    /// Add @p rawDeltaMs to the accumulator and run every whole step.
    /// A negative delta adds nothing.
    TickResult tick(double rawDeltaMs, const FixedUpdateFn& fixedUpdate = {});

    /// Tick with the time elapsed since the previous tickAt() timestamp.
    /// The first call only records @p timestampMs and runs nothing.
    TickResult tickAt(double timestampMs, const FixedUpdateFn& fixedUpdate = {});

    /// Fraction of a step left in the accumulator, in [0, 1).
    [[nodiscard]] double interpolation() const noexcept;

    /// Drop accumulated time and the last timestamp.
    void reset() noexcept;

    /// Change the step to 1000 / @p fps ms, with @p fps clamped.
    void setFixedFramesPerSecond(uint32_t fps) noexcept;

    [[nodiscard]] uint32_t fixedFramesPerSecond() const noexcept { return fps_; }
    [[nodiscard]] double stepMs() const noexcept { return stepMs_; }
    [[nodiscard]] double accumulated() const noexcept { return accumulator_; }
    [[nodiscard]] uint64_t totalUpdates() const noexcept { return totalUpdates_; }

    /// True until some time has been accumulated, and again after reset().
    [[nodiscard]] bool isIdle() const noexcept { return idle_; }

private:
    FixedTimeStep(double stepMs, uint32_t fps) noexcept;

    double stepMs_;
    uint32_t fps_;
    double accumulator_ = 0.0;
    std::optional<double> lastTimestamp_;
    uint64_t totalUpdates_ = 0;
    bool idle_ = true;
};

} // namespace ark::runtime
