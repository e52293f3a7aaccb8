/// @file owner_resolver.cpp
/// @brief OwnerResolver implementation.

#include "otpm/token/owner_resolver.hpp"

#include "otpm/foundation/otp_logger.hpp"

namespace otpm::token {

using foundation::ErrorCode;
using foundation::FieldError;
using foundation::LogCategory;
using foundation::OtpError;
using foundation::OtpResult;

bool Ownership::selfManaged() const {
    if (!owner) {
        return managers.empty();
    }
    return managers.size() == 1 && managers.front() == *owner;
}

OwnerResolver::OwnerResolver(const IIdentityResolver& identities) : identities_(identities) {}

OtpResult<std::string> OwnerResolver::normalizeOwner(std::string_view identifier) const {
    auto resolved = identities_.resolveIdentity(identifier);
    if (resolved.hasError()) {
        if (resolved.error().code() != ErrorCode::UserNotFound) {
            return resolved;
        }
        return OtpResult<std::string>::err(
            OtpError(ErrorCode::OwnerNotFound,
                     "owner '" + std::string(identifier) + "' not found",
                     FieldError{"owner", "no such user"}));
    }
    return resolved;
}

OtpResult<std::string> OwnerResolver::normalizeManager(std::string_view identifier) const {
    auto resolved = identities_.resolveIdentity(identifier);
    if (resolved.hasError() && resolved.error().code() == ErrorCode::UserNotFound) {
        return OtpResult<std::string>::err(
            OtpError(ErrorCode::UserNotFound,
                     "manager '" + std::string(identifier) + "' not found",
                     FieldError{"manager", "no such user"}));
    }
    return resolved;
}

void OwnerResolver::denormalize(TokenRecord& record, const OutputOptions& options) const {
    if (options.raw) {
        return;
    }
    if (record.owner) {
        record.owner = identities_.displayIdentifier(*record.owner);
    }
    for (auto& manager : record.managers) {
        manager = identities_.displayIdentifier(manager);
    }
}

OtpResult<Ownership> OwnerResolver::resolveForCreate(
    const std::optional<std::string>& owner, const std::optional<std::string>& manager) const {
    std::optional<std::string> ownerId = owner;
    std::optional<std::string> managerRef;

    if (manager) {
        auto resolved = normalizeManager(*manager);
        if (resolved.hasError()) {
            return OtpResult<Ownership>::err(resolved.error());
        }
        managerRef = std::move(resolved).value();
    }

    if (!ownerId || !managerRef) {
        if (auto caller = identities_.currentIdentity()) {
            if (!ownerId) {
                ownerId = caller->uid;
            }
            if (*ownerId == caller->uid && !managerRef) {
                managerRef = caller->reference;
            }
        } else {
            OTPM_LOG_DEBUG(LogCategory::Owner, "no caller identity, ownership defaults skipped");
        }
    }

    Ownership result;
    if (ownerId) {
        auto resolved = normalizeOwner(*ownerId);
        if (resolved.hasError()) {
            return OtpResult<Ownership>::err(resolved.error());
        }
        result.owner = std::move(resolved).value();
    }
    if (managerRef) {
        result.managers.push_back(std::move(*managerRef));
    }
    return OtpResult<Ownership>::ok(std::move(result));
}

std::optional<std::vector<std::string>> OwnerResolver::managersAfterOwnerChange(
    const std::string& newOwner, const Ownership& previous) {
    if (previous.owner && *previous.owner == newOwner) {
        return std::nullopt;
    }
    if (!previous.selfManaged()) {
        return std::nullopt;
    }
    return std::vector<std::string>{newOwner};
}

}  // namespace otpm::token
