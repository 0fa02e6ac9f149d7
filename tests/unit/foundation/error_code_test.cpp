#include <gtest/gtest.h>

#include <string>

#include "ark/foundation/kernel_result.hpp"

using namespace ark::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ActorPendingDestruction), "Scene");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoaderNotRegistered), "Asset");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidTimeStep), "Runtime");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, UnknownRangeHasUnknownSubsystem) {
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0x7F01)), "Unknown");
}

TEST(ErrorCodeTest, NamesMatchEnumerators) {
    EXPECT_EQ(errorCodeName(ErrorCode::AssetNotReady), "AssetNotReady");
    EXPECT_EQ(errorCodeName(ErrorCode::LoopAlreadyRunning), "LoopAlreadyRunning");
    EXPECT_EQ(errorCodeName(static_cast<ErrorCode>(0x7F01)), "Unknown");
}

// --- KernelError tests ---

TEST(KernelErrorTest, DefaultConstruction) {
    KernelError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(KernelErrorTest, CodeAndMessage) {
    KernelError err(ErrorCode::AssetNotReady, "asset not loaded");
    EXPECT_EQ(err.code(), ErrorCode::AssetNotReady);
    EXPECT_EQ(err.message(), "asset not loaded");
    EXPECT_EQ(err.subsystem(), "Asset");
    EXPECT_EQ(err.name(), "AssetNotReady");
}

TEST(KernelErrorTest, AssetKeyContext) {
    KernelError err(ErrorCode::AssetLoadFailed, "bad file", std::string("ui/title.txt"));
    EXPECT_TRUE(err.hasContext());
    auto* key = err.context<std::string>();
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(*key, "ui/title.txt");

    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(KernelErrorTest, ToStringNamesSubsystemAndCode) {
    EXPECT_EQ(KernelError(ErrorCode::InvalidTimeStep, "step must be positive").toString(),
              "[Runtime] InvalidTimeStep: step must be positive");
    EXPECT_EQ(KernelError(ErrorCode::LoggerFlushFailed).toString(), "[Logger] LoggerFlushFailed");
}

// --- KernelResult tests ---

TEST(KernelResultTest, ErrorValue) {
    auto result = KernelResult<int>::err(
        KernelError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(KernelResultTest, VoidError) {
    auto result = KernelResult<void>::err(
        KernelError(ErrorCode::LoopAlreadyRunning, "frame loop is already running"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::LoopAlreadyRunning);
}
