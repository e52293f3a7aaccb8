#pragma once

/// @file validity_validator.hpp
/// @brief Validity interval checks (notBefore <= notAfter) for create and
/// partial update.

#include "otpm/foundation/otp_result.hpp"
#include "otpm/token/token_types.hpp"

#include <functional>
#include <optional>

namespace otpm::token {

/// Pair of optional validity bounds.
struct ValidityBounds {
    std::optional<Timestamp> notBefore;
    std::optional<Timestamp> notAfter;
};

/// True unless both bounds are set and notBefore is later than notAfter.
[[nodiscard]] bool intervalIsOrdered(const ValidityBounds& bounds) noexcept;

/// Stateless interval validation.
class ValidityValidator {
public:
    /// Reads the bounds currently stored for the token being updated.
    using StoredBoundsLoader = std::function<foundation::OtpResult<ValidityBounds>()>;

    /// Check the bounds of a creation request. A violation names notAfter.
    [[nodiscard]] static foundation::OtpResult<void> checkCreate(const ValidityBounds& requested);

    /// Check the bounds of an update request.
    ///
    /// When exactly one bound is requested, @p loadStored supplies the other
    /// one; otherwise stored state is ignored and @p loadStored is not called.
    /// A violation names notBefore when only notBefore was requested and
    /// notAfter in every other case. Loader errors propagate unchanged.
    [[nodiscard]] static foundation::OtpResult<void> checkUpdate(
        const ValidityBounds& requested, const StoredBoundsLoader& loadStored);
};

}  // namespace otpm::token
