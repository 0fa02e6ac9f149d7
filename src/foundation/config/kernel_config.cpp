#include "ark/foundation/kernel_config.hpp"

#include <algorithm>
#include <cctype>

namespace ark::foundation {

namespace {

KernelError invalidValue(std::string_view key, std::string_view reason) {
    return KernelError(ErrorCode::ConfigValueInvalid,
                       std::string(key) + ": " + std::string(reason));
}

std::string loggingKey(LogCategory cat) {
    std::string name(logCategoryName(cat));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "logging." + name;
}

} // namespace

KernelResult<KernelConfig> loadKernelConfig(const ConfigManager& config) {
    KernelConfig out;

    // Signed reads so a negative value is reported as invalid, not as a
    // conversion failure.
    auto fps = config.getOr<int64_t>("runtime.fps", out.fps);
    if (!fps) {
        return KernelResult<KernelConfig>::err(fps.error());
    }
    if (fps.value() <= 0) {
        return KernelResult<KernelConfig>::err(invalidValue("runtime.fps", "must be positive"));
    }
    out.fps = static_cast<uint32_t>(fps.value());

    auto fixedFps = config.getOr<int64_t>("runtime.fixed_fps", out.fixedFps);
    if (!fixedFps) {
        return KernelResult<KernelConfig>::err(fixedFps.error());
    }
    if (fixedFps.value() <= 0) {
        return KernelResult<KernelConfig>::err(
            invalidValue("runtime.fixed_fps", "must be positive"));
    }
    out.fixedFps = static_cast<uint32_t>(fixedFps.value());

    auto maxDelta = config.getOr<double>("runtime.max_frame_delta_ms", out.maxFrameDeltaMs);
    if (!maxDelta) {
        return KernelResult<KernelConfig>::err(maxDelta.error());
    }
    if (maxDelta.value() <= 0.0) {
        return KernelResult<KernelConfig>::err(
            invalidValue("runtime.max_frame_delta_ms", "must be positive"));
    }
    out.maxFrameDeltaMs = maxDelta.value();

    auto maxSteps = config.getOr<int64_t>("runtime.max_steps_per_frame", out.maxStepsPerFrame);
    if (!maxSteps) {
        return KernelResult<KernelConfig>::err(maxSteps.error());
    }
    if (maxSteps.value() <= 0) {
        return KernelResult<KernelConfig>::err(
            invalidValue("runtime.max_steps_per_frame", "must be at least 1"));
    }
    out.maxStepsPerFrame = static_cast<uint32_t>(maxSteps.value());

    auto autoload = config.getOr<bool>("assets.autoload", out.assetsAutoload);
    if (!autoload) {
        return KernelResult<KernelConfig>::err(autoload.error());
    }
    out.assetsAutoload = autoload.value();

    auto root = config.getOr<std::string>("assets.root", out.assetsRoot);
    if (!root) {
        return KernelResult<KernelConfig>::err(root.error());
    }
    out.assetsRoot = root.value();

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto key = loggingKey(static_cast<LogCategory>(i));
        if (!config.hasKey(key)) {
            continue;
        }
        auto name = config.get<std::string>(key);
        if (!name) {
            return KernelResult<KernelConfig>::err(name.error());
        }
        auto level = parseLogLevel(name.value());
        if (!level) {
            return KernelResult<KernelConfig>::err(
                invalidValue(key, "unknown log level '" + name.value() + "'"));
        }
        out.logLevels[i] = *level;
    }

    return KernelResult<KernelConfig>::ok(std::move(out));
}

void applyLogLevels(const KernelConfig& config, KernelLogger& logger) {
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        if (config.logLevels[i]) {
            logger.setCategoryLevel(static_cast<LogCategory>(i), *config.logLevels[i]);
        }
    }
}

} // namespace ark::foundation
