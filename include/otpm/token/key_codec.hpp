#pragma once

/// @file key_codec.hpp
/// @brief Shared-secret codec: base32 (RFC 4648) encode/decode, confirmation
/// check and random key generation.

#include "otpm/foundation/otp_result.hpp"
#include "otpm/token/token_types.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace otpm::token {

/// Stateless key material utilities.
///
/// Decoded key bytes are never written to logs or returned on read paths;
/// the only re-encoding happens for the one-time provisioning URI.
///
/// Example:
/// @code
///   KeyInput input{std::string("jbswy3dpehpk3pxp"), std::string("jbswy3dpehpk3pxp")};
///   auto key = KeyCodec::decode(input);   // 10 bytes
///   auto text = KeyCodec::encodeBase32(key.value(), false);
/// @endcode
class KeyCodec {
public:
    /// Encode @p key with the standard base32 alphabet. When @p pad is set the
    /// output is '='-padded to a multiple of 8 characters.
    [[nodiscard]] static std::string encodeBase32(const KeyBytes& key, bool pad = true);

    /// Decode base32 text, case-insensitively. The text must be padded to a
    /// multiple of 8 characters; unpadded input of any other length fails with
    /// "Incorrect padding".
    /// @return Bytes, or KeyEncodingInvalid carrying the decoder message.
    [[nodiscard]] static foundation::OtpResult<KeyBytes> decodeBase32(std::string_view text);

    /// Resolve a caller-supplied key.
    ///
    /// A confirmation that differs from the value fails with KeyMismatch
    /// before anything is decoded. Text values are base32-decoded; byte values
    /// pass through. The result must be a non-empty multiple of 5 bytes.
    [[nodiscard]] static foundation::OtpResult<KeyBytes> decode(const KeyInput& input);

    /// Generate @p length bytes from the OpenSSL CSPRNG.
    [[nodiscard]] static foundation::OtpResult<KeyBytes> generate(std::size_t length = kKeyLength);
};

}  // namespace otpm::token
