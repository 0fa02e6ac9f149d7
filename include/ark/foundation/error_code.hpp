#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the actor runtime kernel.

#include <cstdint>
#include <string_view>

namespace ark::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Unknown = 0x0001,
    InvalidArgument = 0x0002,

    // Scene (0x0100 - 0x01FF)
    ActorPendingDestruction = 0x0101,

    // Asset (0x0200 - 0x02FF)
    LoaderNotRegistered = 0x0201,
    AssetNotReady = 0x0202,
    AssetLoadFailed = 0x0203,
    AssetTypeMismatch = 0x0204,

    // Runtime (0x0300 - 0x03FF)
    InvalidTimeStep = 0x0301,
    LoopAlreadyRunning = 0x0302,

    // Config (0x0400 - 0x04FF)
    ConfigLoadFailed = 0x0400,
    ConfigKeyNotFound = 0x0401,
    ConfigTypeMismatch = 0x0402,
    ConfigValueInvalid = 0x0403,

    // Logger (0x0500 - 0x05FF)
    LoggerFlushFailed = 0x0502,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Scene";
        case 0x0200: return "Asset";
        case 0x0300: return "Runtime";
        case 0x0400: return "Config";
        case 0x0500: return "Logger";
        default: return "Unknown";
    }
}

/// Enumerator name of @p code, or "Unknown" for values outside the enum.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ActorPendingDestruction: return "ActorPendingDestruction";
        case ErrorCode::LoaderNotRegistered: return "LoaderNotRegistered";
        case ErrorCode::AssetNotReady: return "AssetNotReady";
        case ErrorCode::AssetLoadFailed: return "AssetLoadFailed";
        case ErrorCode::AssetTypeMismatch: return "AssetTypeMismatch";
        case ErrorCode::InvalidTimeStep: return "InvalidTimeStep";
        case ErrorCode::LoopAlreadyRunning: return "LoopAlreadyRunning";
        case ErrorCode::ConfigLoadFailed: return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound: return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::ConfigValueInvalid: return "ConfigValueInvalid";
        case ErrorCode::LoggerFlushFailed: return "LoggerFlushFailed";
    }
    return "Unknown";
}

} // namespace ark::foundation
