#pragma once

/// @file schema_resolver.hpp
/// @brief Maps between the typed Token model and the flat attribute map used
/// at the storage boundary.
///
/// Each token type owns a field group and a schema-class marker. Only the
/// group matching the token's type is ever written; foreign fields supplied by
/// a caller are dropped without error.

#include "otpm/foundation/otp_result.hpp"
#include "otpm/token/token_store.hpp"
#include "otpm/token/token_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otpm::token {

/// Stored attribute names.
namespace attr {
inline constexpr std::string_view kObjectClass = "objectClass";
inline constexpr std::string_view kTokenId = "tokenId";
inline constexpr std::string_view kOwner = "tokenOwner";
inline constexpr std::string_view kManagedBy = "managedBy";
inline constexpr std::string_view kDisabled = "tokenDisabled";
inline constexpr std::string_view kNotBefore = "tokenNotBefore";
inline constexpr std::string_view kNotAfter = "tokenNotAfter";
inline constexpr std::string_view kDescription = "description";
inline constexpr std::string_view kVendor = "tokenVendor";
inline constexpr std::string_view kModel = "tokenModel";
inline constexpr std::string_view kSerial = "tokenSerial";
inline constexpr std::string_view kKey = "otpKey";
inline constexpr std::string_view kAlgorithm = "otpAlgorithm";
inline constexpr std::string_view kDigits = "otpDigits";
inline constexpr std::string_view kTotpClockOffset = "totpClockOffset";
inline constexpr std::string_view kTotpTimeStep = "totpTimeStep";
inline constexpr std::string_view kHotpCounter = "hotpCounter";
}  // namespace attr

/// Marker carried by every token record.
inline constexpr std::string_view kTokenClass = "otpToken";

/// Defaults applied when a creation request leaves a field unset.
struct TokenDefaults {
    TokenType type = TokenType::Totp;
    HashAlgorithm algorithm = HashAlgorithm::Sha1;
    int digits = kDefaultDigits;
    int64_t clockOffset = kDefaultClockOffset;
    int64_t timeStep = kDefaultTimeStep;
    int64_t counter = kDefaultCounter;
    std::size_t keyLength = kKeyLength;
};

/// Type-specific marker ("otpTokenTotp", "otpTokenHotp").
[[nodiscard]] std::string schemaClassFor(TokenType type);

/// Full marker set for a new record of @p type.
[[nodiscard]] std::vector<std::string> objectClassesFor(TokenType type);

/// Attributes belonging to @p type's field group.
[[nodiscard]] const std::vector<std::string_view>& typeAttributes(TokenType type);

/// Stored attribute name for an informational field ("vendor" -> "tokenVendor").
[[nodiscard]] std::string_view infoAttribute(std::string_view field);

class SchemaResolver {
public:
    explicit SchemaResolver(TokenDefaults defaults = {});

    /// Resolve the typed parts of a creation request: type, the matching
    /// field group, algorithm, digits, flags, validity bounds and info.
    ///
    /// id, key and ownership are left for the caller. An unknown type fails
    /// with UnknownTokenType; out-of-range write-once parameters fail with
    /// ValidationFailed naming the field.
    [[nodiscard]] foundation::OtpResult<Token> resolve(const CreateRequest& request) const;

    [[nodiscard]] const TokenDefaults& defaults() const noexcept { return defaults_; }

    /// Flatten a token for storage. objectClass is not included; pass
    /// objectClassesFor(token.type()) to the store separately.
    [[nodiscard]] static AttributeMap toAttributes(const Token& token);

    /// First stored marker naming a known type, or nullopt.
    [[nodiscard]] static std::optional<TokenType> deriveType(const AttributeMap& attributes);

    /// Remove every type-specific attribute that does not belong to @p type.
    /// With no type, all type-specific attributes are removed.
    static void stripForeignAttributes(AttributeMap& attributes, std::optional<TokenType> type);

    /// Convert a stored record to caller output. The key attribute is always
    /// dropped; markers are kept only when options.all is set without
    /// pkeyOnly. Owner and managers stay canonical.
    [[nodiscard]] static foundation::OtpResult<TokenRecord> toRecord(AttributeMap attributes,
                                                                     const OutputOptions& options);

private:
    TokenDefaults defaults_;
};

}  // namespace otpm::token
