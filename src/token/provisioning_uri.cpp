/// @file provisioning_uri.cpp
/// @brief ProvisioningUri implementation.

#include "otpm/token/provisioning_uri.hpp"

#include "otpm/foundation/otp_logger.hpp"
#include "otpm/token/key_codec.hpp"

#include "detail/text_utils.hpp"

#include <utility>
#include <vector>

namespace otpm::token {

using foundation::LogCategory;

std::string ProvisioningUri::resolveIssuer(const ITokenStore& store,
                                           const std::optional<std::string>& ownerReference,
                                           std::string_view realm) {
    if (!ownerReference) {
        return std::string(realm);
    }
    auto principal = store.lookupAttribute(*ownerReference, kPrincipalAttribute);
    if (principal.hasError()) {
        OTPM_LOG_DEBUG(LogCategory::Provisioning,
                       "issuer lookup failed (" + std::string(principal.error().message()) +
                           "), using realm");
        return std::string(realm);
    }
    return std::move(principal).value();
}

std::string ProvisioningUri::build(const Token& token, std::string_view issuer) {
    std::vector<std::pair<std::string, std::string>> params;
    params.emplace_back("issuer", std::string(issuer));
    params.emplace_back("secret", KeyCodec::encodeBase32(token.key, false));
    params.emplace_back("digits", std::to_string(token.digits));
    params.emplace_back("algorithm", detail::toUpper(algorithmName(token.algorithm)));

    if (const auto* totp = std::get_if<TotpParams>(&token.params)) {
        params.emplace_back("period", std::to_string(totp->timeStep));
    } else if (const auto* hotp = std::get_if<HotpParams>(&token.params)) {
        params.emplace_back("counter", std::to_string(hotp->counter));
    }

    std::string uri = "otpauth://";
    uri += tokenTypeName(token.type());
    uri += "/";
    uri += issuer;
    uri += ":";
    uri += detail::percentEncode(token.id);
    uri += "?";
    uri += detail::formEncode(params);
    return uri;
}

}  // namespace otpm::token
