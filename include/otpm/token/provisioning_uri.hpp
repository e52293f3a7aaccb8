#pragma once

/// @file provisioning_uri.hpp
/// @brief otpauth:// provisioning URI construction.
///
/// The URI is the only plaintext exposure of a token's key. It is built once
/// during creation and is never persisted.

#include "otpm/token/token_store.hpp"
#include "otpm/token/token_types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace otpm::token {

class ProvisioningUri {
public:
    /// Principal name of @p ownerReference, or @p realm when there is no owner
    /// or the lookup fails for any reason.
    [[nodiscard]] static std::string resolveIssuer(const ITokenStore& store,
                                                   const std::optional<std::string>& ownerReference,
                                                   std::string_view realm);

    /// Build the URI for a fully resolved token.
    ///
    /// Format:
    /// @code
    ///   otpauth://totp/ISSUER:label?issuer=ISSUER&secret=B32&digits=6&algorithm=SHA1&period=30
    /// @endcode
    /// The label is the percent-encoded token id; the secret is unpadded
    /// base32; HOTP tokens carry counter instead of period.
    [[nodiscard]] static std::string build(const Token& token, std::string_view issuer);
};

}  // namespace otpm::token
