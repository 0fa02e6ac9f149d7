#include <gtest/gtest.h>

#include "ark/foundation/kernel_config.hpp"

using namespace ark::foundation;

namespace {

KernelResult<KernelConfig> loadFrom(const std::string& yaml) {
    ConfigManager config;
    auto loaded = config.loadString(yaml);
    if (!loaded) {
        return KernelResult<KernelConfig>::err(loaded.error());
    }
    return loadKernelConfig(config);
}

} // namespace

TEST(KernelConfigTest, EmptyConfigKeepsDefaults) {
    auto result = loadFrom("");
    ASSERT_TRUE(result.hasValue());

    const auto& cfg = result.value();
    EXPECT_EQ(cfg.fps, 60u);
    EXPECT_EQ(cfg.fixedFps, 60u);
    EXPECT_DOUBLE_EQ(cfg.maxFrameDeltaMs, 1000.0);
    EXPECT_EQ(cfg.maxStepsPerFrame, 5u);
    EXPECT_TRUE(cfg.assetsAutoload);
    EXPECT_EQ(cfg.assetsRoot, "assets");
    for (const auto& level : cfg.logLevels) {
        EXPECT_FALSE(level.has_value());
    }
}

TEST(KernelConfigTest, ReadsEverySection) {
    auto result = loadFrom(R"(
runtime:
  fps: 144
  fixed_fps: 30
  max_frame_delta_ms: 250
  max_steps_per_frame: 3
assets:
  autoload: false
  root: "content"
logging:
  scene: debug
  behavior: error
)");
    ASSERT_TRUE(result.hasValue());

    const auto& cfg = result.value();
    EXPECT_EQ(cfg.fps, 144u);
    EXPECT_EQ(cfg.fixedFps, 30u);
    EXPECT_DOUBLE_EQ(cfg.maxFrameDeltaMs, 250.0);
    EXPECT_EQ(cfg.maxStepsPerFrame, 3u);
    EXPECT_FALSE(cfg.assetsAutoload);
    EXPECT_EQ(cfg.assetsRoot, "content");
    EXPECT_EQ(cfg.logLevels[static_cast<std::size_t>(LogCategory::Scene)], LogLevel::Debug);
    EXPECT_EQ(cfg.logLevels[static_cast<std::size_t>(LogCategory::Behavior)], LogLevel::Error);
    EXPECT_FALSE(cfg.logLevels[static_cast<std::size_t>(LogCategory::Asset)].has_value());
}

TEST(KernelConfigTest, DerivedDurations) {
    KernelConfig cfg;
    cfg.fixedFps = 50;
    cfg.fps = 100;
    EXPECT_DOUBLE_EQ(cfg.fixedStepMs(), 20.0);
    EXPECT_DOUBLE_EQ(cfg.frameBudgetMs(), 10.0);
}

TEST(KernelConfigTest, NonPositiveRateIsInvalid) {
    auto result = loadFrom("runtime:\n  fixed_fps: 0\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigValueInvalid);

    result = loadFrom("runtime:\n  fps: -5\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigValueInvalid);
}

TEST(KernelConfigTest, ZeroStepCapIsInvalid) {
    auto result = loadFrom("runtime:\n  max_steps_per_frame: 0\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigValueInvalid);
}

TEST(KernelConfigTest, WrongTypeIsMismatch) {
    auto result = loadFrom("assets:\n  autoload: sometimes\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(KernelConfigTest, UnknownLogLevelIsInvalid) {
    auto result = loadFrom("logging:\n  core: loud\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigValueInvalid);
}

TEST(KernelConfigTest, ApplyLogLevelsOnlyTouchesConfiguredCategories) {
    KernelLogger logger;
    KernelConfig cfg;
    cfg.logLevels[static_cast<std::size_t>(LogCategory::Asset)] = LogLevel::Trace;

    applyLogLevels(cfg, logger);

    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Asset), LogLevel::Trace);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Behavior), LogLevel::Warning);
}
