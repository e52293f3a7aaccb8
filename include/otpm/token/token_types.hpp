#pragma once

/// @file token_types.hpp
/// @brief Core type definitions for OTP token records.
///
/// Defines the typed token model (TOTP | HOTP), the request shapes accepted
/// by TokenManager, and the record shape returned to callers.

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace otpm::token {

// -- Enumerations -------------------------------------------------------------

/// Closed set of token types. Fixed for the life of a token.
enum class TokenType : uint8_t { Totp, Hotp };

/// HMAC hash used for code generation. Write-once.
enum class HashAlgorithm : uint8_t { Sha1, Sha256, Sha384, Sha512 };

inline constexpr std::array<TokenType, 2> kTokenTypes = {TokenType::Totp, TokenType::Hotp};

/// Lowercase tag ("totp", "hotp").
constexpr std::string_view tokenTypeName(TokenType type) {
    switch (type) {
        case TokenType::Totp: return "totp";
        case TokenType::Hotp: return "hotp";
    }
    return "totp";
}

/// Case-insensitive parse of a token type tag.
[[nodiscard]] std::optional<TokenType> parseTokenType(std::string_view name);

/// Lowercase algorithm name ("sha1", ...).
constexpr std::string_view algorithmName(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Sha1:   return "sha1";
        case HashAlgorithm::Sha256: return "sha256";
        case HashAlgorithm::Sha384: return "sha384";
        case HashAlgorithm::Sha512: return "sha512";
    }
    return "sha1";
}

/// Case-insensitive parse of an algorithm name.
[[nodiscard]] std::optional<HashAlgorithm> parseAlgorithm(std::string_view name);

// -- Constants ----------------------------------------------------------------

/// Generated key length in bytes. Multiple of 5 so the base32 form is unpadded.
inline constexpr std::size_t kKeyLength = 20;

inline constexpr int kDefaultDigits = 6;
inline constexpr int64_t kDefaultClockOffset = 0;
inline constexpr int64_t kDefaultTimeStep = 30;
inline constexpr int64_t kMinTimeStep = 5;
inline constexpr int64_t kDefaultCounter = 0;
inline constexpr int64_t kMinCounter = 0;

/// Free-text informational fields. Stored verbatim, never validated.
inline constexpr std::array<std::string_view, 4> kInfoFieldNames = {
    "description", "vendor", "model", "serial"};

[[nodiscard]] bool isInfoField(std::string_view name);

// -- Typed model --------------------------------------------------------------

using Timestamp = std::chrono::system_clock::time_point;
using KeyBytes = std::vector<uint8_t>;
using InfoFields = std::map<std::string, std::string>;

struct TotpParams {
    int64_t clockOffset = kDefaultClockOffset;
    int64_t timeStep = kDefaultTimeStep;  ///< Seconds, >= kMinTimeStep.

    bool operator==(const TotpParams&) const = default;
};

struct HotpParams {
    int64_t counter = kDefaultCounter;  ///< >= kMinCounter.

    bool operator==(const HotpParams&) const = default;
};

/// Exactly one type-specific field group per token.
using TypeParams = std::variant<TotpParams, HotpParams>;

[[nodiscard]] inline TokenType typeOf(const TypeParams& params) noexcept {
    return std::holds_alternative<HotpParams>(params) ? TokenType::Hotp : TokenType::Totp;
}

/// Fully resolved token, as persisted.
///
/// owner and managers hold canonical directory references, not display ids.
struct Token {
    std::string id;
    TypeParams params{TotpParams{}};
    KeyBytes key;
    HashAlgorithm algorithm = HashAlgorithm::Sha1;
    int digits = kDefaultDigits;
    std::optional<std::string> owner;
    std::vector<std::string> managers;
    bool disabled = false;
    std::optional<Timestamp> notBefore;
    std::optional<Timestamp> notAfter;
    InfoFields info;

    [[nodiscard]] TokenType type() const noexcept { return typeOf(params); }
};

/// Token as returned to callers. Never carries key material.
///
/// type is absent when the stored record has no recognized type marker.
struct TokenRecord {
    std::string id;
    std::optional<TokenType> type;
    std::optional<TypeParams> params;
    std::optional<HashAlgorithm> algorithm;
    std::optional<int> digits;
    std::optional<std::string> owner;
    std::vector<std::string> managers;
    bool disabled = false;
    std::optional<Timestamp> notBefore;
    std::optional<Timestamp> notAfter;
    InfoFields info;
    std::vector<std::string> objectClasses;  ///< Only kept with OutputOptions::all.
};

// -- Key input ----------------------------------------------------------------

/// A key as supplied by a caller: raw bytes or base32 text.
using KeyValue = std::variant<KeyBytes, std::string>;

/// Caller-supplied key, optionally with a confirmation copy that must be
/// identical to the value before any decoding takes place.
struct KeyInput {
    KeyValue value;
    std::optional<KeyValue> confirmation;
};

// -- Requests -----------------------------------------------------------------

/// Output shaping shared by every read path.
struct OutputOptions {
    bool all = false;       ///< Keep the schema-class marker set.
    bool raw = false;       ///< Skip owner/manager denormalization.
    bool pkeyOnly = false;  ///< Search: return ids only.
};

/// Creation request. Fields of the other type's group are accepted and
/// silently dropped during schema resolution.
struct CreateRequest {
    std::optional<std::string> id;
    std::optional<std::string> type;  ///< Defaults to ManagerConfig::defaultType.
    std::optional<KeyInput> key;      ///< Random key when absent.
    std::optional<std::string> algorithm;
    std::optional<int> digits;
    std::optional<int64_t> clockOffset;
    std::optional<int64_t> timeStep;
    std::optional<int64_t> counter;
    std::optional<std::string> owner;    ///< User identifier.
    std::optional<std::string> manager;  ///< User identifier.
    std::optional<bool> disabled;
    std::optional<Timestamp> notBefore;
    std::optional<Timestamp> notAfter;
    InfoFields info;
};

/// Partial update. id, type and key parameters are write-once and cannot
/// appear here. An info entry mapped to nullopt clears that field.
struct UpdateRequest {
    std::string id;
    std::optional<std::string> owner;
    std::optional<std::string> manager;
    std::optional<bool> disabled;
    std::optional<Timestamp> notBefore;
    std::optional<Timestamp> notAfter;
    std::map<std::string, std::optional<std::string>> info;

    [[nodiscard]] bool empty() const noexcept {
        return !owner && !manager && !disabled && !notBefore && !notAfter && info.empty();
    }
};

struct SearchRequest {
    std::string criteria;              ///< Substring match over id and info fields.
    std::optional<std::string> type;   ///< Unknown values are ignored.
    std::optional<std::string> owner;  ///< User identifier.
    std::optional<bool> disabled;
    InfoFields info;                   ///< Exact matches.
    std::size_t sizeLimit = 0;         ///< 0 = unlimited.
};

// -- Results ------------------------------------------------------------------

/// Result of a creation. uri is the only plaintext exposure of the key and
/// cannot be recomputed later.
struct CreateResult {
    TokenRecord token;
    std::string uri;
};

struct SearchResult {
    std::vector<TokenRecord> tokens;
    bool truncated = false;
};

/// Outcome of a manager membership change. Per-user failures do not abort
/// the others.
struct MembershipResult {
    TokenRecord token;
    std::size_t completed = 0;
    std::vector<std::pair<std::string, std::string>> failed;  ///< (user, reason)
};

}  // namespace otpm::token
