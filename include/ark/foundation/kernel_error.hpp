#pragma once

/// @file kernel_error.hpp
/// @brief Error value carried by KernelResult.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "ark/foundation/error_code.hpp"

namespace ark::foundation {

/// What went wrong, where, and optionally on what.
///
/// The context is whatever the failing operation had in hand: asset
/// failures carry the asset key as a std::string, everything else
/// carries nothing.
class KernelError {
public:
    KernelError() = default;

    explicit KernelError(ErrorCode code) : code_(code) {}

    KernelError(ErrorCode code, std::string message, std::any context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }
    [[nodiscard]] std::string_view name() const noexcept { return errorCodeName(code_); }

    /// Typed context, or nullptr when empty or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// "[Subsystem] Name: message", or without ": message" when empty.
    [[nodiscard]] std::string toString() const {
        std::string out = "[" + std::string(subsystem()) + "] " + std::string(name());
        if (!message_.empty()) {
            out += ": " + message_;
        }
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace ark::foundation
