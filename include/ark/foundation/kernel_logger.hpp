#pragma once

/// @file kernel_logger.hpp
/// @brief KernelLogger wrapping kcenon logger_system for categorized kernel logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ark/foundation/kernel_result.hpp"

namespace ark::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Kernel log categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Configuration, task queue, ids
    Scene    = 1, ///< Actor hierarchy and component lifecycle
    Asset    = 2, ///< Resource pipeline
    Runtime  = 3, ///< Frame orchestration and host loop
    Behavior = 4  ///< Behavior dependency wiring
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Scene", "Asset", "Runtime", "Behavior"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a case-insensitive level name ("debug", "WARNING", "warn", ...).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a case-insensitive category name ("scene", "Asset", ...).
[[nodiscard]] std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.actorId = actor.Id();
///   ctx.extra["pattern"] = "root/**/leaf";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Scene,
///                         "query started", ctx);
/// @endcode
struct LogContext {
    std::optional<uint64_t> actorId;
    std::optional<uint64_t> componentId;
    std::optional<std::string> assetId;
    std::optional<uint64_t> frame;
    std::unordered_map<std::string, std::string> extra;
};

/// Kernel logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Scene    | Info          |
/// | Asset    | Info          |
/// | Runtime  | Info          |
/// | Behavior | Warning       |
class KernelLogger {
public:
    KernelLogger();
    ~KernelLogger();

    KernelLogger(const KernelLogger&) = delete;
    KernelLogger& operator=(const KernelLogger&) = delete;
    KernelLogger(KernelLogger&&) noexcept;
    KernelLogger& operator=(KernelLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with context appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    KernelResult<void> flush();

    /// Process-wide logger used by the ARK_LOG macros.
    static KernelLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ark::foundation

/// @name ARK_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// ARK_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef ARK_MIN_LOG_LEVEL
    #define ARK_MIN_LOG_LEVEL 0
#endif

#define ARK_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= ARK_MIN_LOG_LEVEL &&                      \
            ::ark::foundation::KernelLogger::instance().isEnabled((level), (cat))) \
        {                                                                        \
            ::ark::foundation::KernelLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define ARK_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                         \
        if (static_cast<int>(level) >= ARK_MIN_LOG_LEVEL &&                      \
            ::ark::foundation::KernelLogger::instance().isEnabled((level), (cat))) \
        {                                                                        \
            ::ark::foundation::KernelLogger::instance().logWithContext(          \
                (level), (cat), (msg), (ctx));                                   \
        }                                                                        \
    } while (0)

#define ARK_LOG_DEBUG(cat, msg) \
    ARK_LOG(::ark::foundation::LogLevel::Debug, (cat), (msg))

#define ARK_LOG_INFO(cat, msg) \
    ARK_LOG(::ark::foundation::LogLevel::Info, (cat), (msg))

#define ARK_LOG_WARN(cat, msg) \
    ARK_LOG(::ark::foundation::LogLevel::Warning, (cat), (msg))

#define ARK_LOG_ERROR(cat, msg) \
    ARK_LOG(::ark::foundation::LogLevel::Error, (cat), (msg))

/// @}
