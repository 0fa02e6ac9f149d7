#pragma once

/// @file kernel_config.hpp
/// @brief Validated kernel settings read from a ConfigManager.

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "ark/foundation/config_manager.hpp"
#include "ark/foundation/kernel_logger.hpp"
#include "ark/foundation/kernel_result.hpp"

namespace ark::foundation {

/// Kernel settings with their defaults.
///
/// | Key                          | Default  |
/// |------------------------------|----------|
/// | runtime.fps                  | 60       |
/// | runtime.fixed_fps            | 60       |
/// | runtime.max_frame_delta_ms   | 1000     |
/// | runtime.max_steps_per_frame  | 5        |
/// | assets.autoload              | true     |
/// | assets.root                  | "assets" |
/// | logging.<category>           | (unset)  |
struct KernelConfig {
    uint32_t fps = 60;
    uint32_t fixedFps = 60;
    double maxFrameDeltaMs = 1000.0;
    uint32_t maxStepsPerFrame = 5;
    bool assetsAutoload = true;
    std::string assetsRoot = "assets";

    /// Per-category level overrides; unset entries keep the logger default.
    std::array<std::optional<LogLevel>, kLogCategoryCount> logLevels{};

    /// Length of one fixed step in milliseconds.
    [[nodiscard]] double fixedStepMs() const { return 1000.0 / fixedFps; }

    /// Frame budget of the host loop in milliseconds.
    [[nodiscard]] double frameBudgetMs() const { return 1000.0 / fps; }
};

/// Read and validate kernel settings. Missing keys keep their defaults.
///
/// Fails with ConfigTypeMismatch for a value of the wrong type and with
/// ConfigValueInvalid for a non-positive rate, a zero step cap, a
/// non-positive delta limit or an unknown log level name.
[[nodiscard]] KernelResult<KernelConfig> loadKernelConfig(const ConfigManager& config);

/// Push the configured per-category levels into @p logger.
void applyLogLevels(const KernelConfig& config, KernelLogger& logger);

} // namespace ark::foundation
