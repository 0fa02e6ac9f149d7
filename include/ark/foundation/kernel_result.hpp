#pragma once

/// @file kernel_result.hpp
/// @brief KernelResult<T> type alias for kernel error handling.

#include "ark/core/result.hpp"
#include "ark/foundation/kernel_error.hpp"

namespace ark::foundation {

/// Result type specialized with KernelError.
///
/// Example:
/// @code
///   KernelResult<double> stepFromRate(double fps) {
///       if (fps <= 0.0) {
///           return KernelResult<double>::err(
///               KernelError(ErrorCode::InvalidTimeStep, "rate must be positive"));
///       }
///       return KernelResult<double>::ok(1000.0 / fps);
///   }
/// @endcode
template <typename T>
using KernelResult = ark::Result<T, KernelError>;

}  // namespace ark::foundation
