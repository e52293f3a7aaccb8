#pragma once

/// @file owner_resolver.hpp
/// @brief Owner/manager resolution: identifier normalization, creation
/// defaults and the self-managed re-assignment rule.

#include "otpm/foundation/otp_result.hpp"
#include "otpm/token/token_store.hpp"
#include "otpm/token/token_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otpm::token {

/// Owner and managers of a token, as canonical references.
struct Ownership {
    std::optional<std::string> owner;
    std::vector<std::string> managers;

    /// Owner and management are the same principal, or neither is set.
    [[nodiscard]] bool selfManaged() const;
};

class OwnerResolver {
public:
    explicit OwnerResolver(const IIdentityResolver& identities);

    /// Resolve an owner identifier to its canonical reference.
    /// Fails with OwnerNotFound naming "owner".
    [[nodiscard]] foundation::OtpResult<std::string> normalizeOwner(
        std::string_view identifier) const;

    /// Resolve a manager identifier. Fails with UserNotFound naming "manager".
    [[nodiscard]] foundation::OtpResult<std::string> normalizeManager(
        std::string_view identifier) const;

    /// Convert owner and manager references to display identifiers unless
    /// options.raw is set.
    void denormalize(TokenRecord& record, const OutputOptions& options) const;

    /// Apply the creation defaults and normalize the result.
    ///
    /// When owner or manager is missing the caller's identity is consulted:
    /// owner defaults to the caller, and when the owner is the caller and no
    /// manager was given the caller also becomes the manager.
    [[nodiscard]] foundation::OtpResult<Ownership> resolveForCreate(
        const std::optional<std::string>& owner,
        const std::optional<std::string>& manager) const;

    /// Managers to write when the owner changes to @p newOwner without an
    /// explicit manager. nullopt leaves management untouched.
    [[nodiscard]] static std::optional<std::vector<std::string>> managersAfterOwnerChange(
        const std::string& newOwner, const Ownership& previous);

private:
    const IIdentityResolver& identities_;
};

}  // namespace otpm::token
