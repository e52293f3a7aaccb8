#pragma once

/// @file otp_result.hpp
/// @brief OtpResult<T> type alias for token manager error handling.

#include "otpm/core/result.hpp"
#include "otpm/foundation/otp_error.hpp"

namespace otpm::foundation {

/// Result type specialized with OtpError.
///
/// Example:
/// @code
///   OtpResult<int> parseDigits(int digits) {
///       if (digits != 6 && digits != 8) {
///           return OtpResult<int>::err(
///               OtpError::validation("digits", "must be 6 or 8"));
///       }
///       return OtpResult<int>::ok(digits);
///   }
/// @endcode
template <typename T>
using OtpResult = otpm::Result<T, OtpError>;

}  // namespace otpm::foundation
