#pragma once

/// @file otp_error.hpp
/// @brief Error type used with Result<T, OtpError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "otpm/foundation/error_code.hpp"

namespace otpm::foundation {

/// Context attached to ValidationFailed and not-found errors naming the
/// request field that is inconsistent.
struct FieldError {
    std::string field;
    std::string reason;
};

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data.
class OtpError {
public:
    OtpError() = default;

    explicit OtpError(ErrorCode code)
        : code_(code) {}

    OtpError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    OtpError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// Build a ValidationFailed error naming @p field.
    static OtpError validation(std::string field, std::string reason) {
        std::string message = "invalid '" + field + "': " + reason;
        return OtpError(ErrorCode::ValidationFailed, std::move(message),
                        FieldError{std::move(field), std::move(reason)});
    }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// Field named by a FieldError context, empty when there is none.
    [[nodiscard]] std::string_view field() const noexcept {
        const auto* fe = context<FieldError>();
        return fe ? std::string_view(fe->field) : std::string_view{};
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace otpm::foundation
