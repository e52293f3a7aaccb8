/// @file validity_validator.cpp
/// @brief ValidityValidator implementation.

#include "otpm/token/validity_validator.hpp"

#include "otpm/foundation/otp_logger.hpp"

namespace otpm::token {

using foundation::LogCategory;
using foundation::OtpError;
using foundation::OtpResult;

namespace {

OtpError afterStart() {
    return OtpError::validation("notAfter", "is before the validity start");
}

OtpError beforeEnd() {
    return OtpError::validation("notBefore", "is after the validity end");
}

}  // namespace

bool intervalIsOrdered(const ValidityBounds& bounds) noexcept {
    if (!bounds.notBefore || !bounds.notAfter) {
        return true;
    }
    return *bounds.notBefore <= *bounds.notAfter;
}

OtpResult<void> ValidityValidator::checkCreate(const ValidityBounds& requested) {
    if (!intervalIsOrdered(requested)) {
        return OtpResult<void>::err(afterStart());
    }
    return OtpResult<void>::ok();
}

OtpResult<void> ValidityValidator::checkUpdate(const ValidityBounds& requested,
                                               const StoredBoundsLoader& loadStored) {
    ValidityBounds effective = requested;
    bool notAfterRequested = requested.notAfter.has_value();

    if (requested.notBefore.has_value() != requested.notAfter.has_value()) {
        auto stored = loadStored();
        if (stored.hasError()) {
            return OtpResult<void>::err(stored.error());
        }
        if (!effective.notBefore) {
            effective.notBefore = stored.value().notBefore;
        }
        if (!effective.notAfter) {
            effective.notAfter = stored.value().notAfter;
        }
        OTPM_LOG_DEBUG(LogCategory::Token, "checking partial validity update against stored bounds");
    }

    if (intervalIsOrdered(effective)) {
        return OtpResult<void>::ok();
    }
    return OtpResult<void>::err(notAfterRequested ? afterStart() : beforeEnd());
}

}  // namespace otpm::token
