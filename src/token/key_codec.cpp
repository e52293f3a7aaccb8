/// @file key_codec.cpp
/// @brief KeyCodec implementation.

#include "otpm/token/key_codec.hpp"

#include "otpm/foundation/otp_logger.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstdint>
#include <limits>

namespace otpm::token {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::OtpError;
using foundation::OtpResult;

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int decodeSymbol(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a';
    }
    if (c >= '2' && c <= '7') {
        return 26 + (c - '2');
    }
    return -1;
}

OtpResult<KeyBytes> encodingError(std::string decoderMessage) {
    return OtpResult<KeyBytes>::err(
        OtpError(ErrorCode::KeyEncodingInvalid, std::move(decoderMessage),
                 foundation::FieldError{"key", "invalid base32 encoding"}));
}

}  // namespace

std::string KeyCodec::encodeBase32(const KeyBytes& key, bool pad) {
    std::string out;
    out.reserve(8 * ((key.size() + 4) / 5));

    uint32_t buffer = 0;  // Pending bits, right-aligned
    int bits = 0;
    for (auto byte : key) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kAlphabet[(buffer >> bits) & 0x1F]);
        }
    }
    if (bits > 0) {
        out.push_back(kAlphabet[(buffer << (5 - bits)) & 0x1F]);
    }

    if (pad) {
        out.append((8 - out.size() % 8) % 8, '=');
    }
    return out;
}

OtpResult<KeyBytes> KeyCodec::decodeBase32(std::string_view text) {
    auto dataEnd = text.find('=');
    auto data = text.substr(0, dataEnd);

    if (dataEnd != std::string_view::npos) {
        auto padding = text.substr(dataEnd);
        if (padding.find_first_not_of('=') != std::string_view::npos) {
            return encodingError("Non-base32 digit found");
        }
        if (padding.size() != (8 - data.size() % 8) % 8) {
            return encodingError("Incorrect padding");
        }
    } else if (data.size() % 8 != 0) {
        return encodingError("Incorrect padding");
    }

    // Trailing symbol counts that cannot end a quantum
    switch (data.size() % 8) {
        case 1:
        case 3:
        case 6:
            return encodingError("Incorrect padding");
        default:
            break;
    }

    KeyBytes out;
    out.reserve(data.size() * 5 / 8);
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : data) {
        auto value = decodeSymbol(c);
        if (value < 0) {
            return encodingError("Non-base32 digit found");
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return OtpResult<KeyBytes>::ok(std::move(out));
}

OtpResult<KeyBytes> KeyCodec::decode(const KeyInput& input) {
    if (input.confirmation && *input.confirmation != input.value) {
        return OtpResult<KeyBytes>::err(
            OtpError(ErrorCode::KeyMismatch, "key confirmation does not match",
                     foundation::FieldError{"key", "passwords do not match"}));
    }

    KeyBytes key;
    if (const auto* text = std::get_if<std::string>(&input.value)) {
        auto decoded = decodeBase32(*text);
        if (decoded.hasError()) {
            return decoded;
        }
        key = std::move(decoded).value();
    } else {
        key = std::get<KeyBytes>(input.value);
    }

    if (key.empty() || key.size() % 5 != 0) {
        return OtpResult<KeyBytes>::err(
            OtpError::validation("key", "length must be a non-zero multiple of 5 bytes"));
    }
    return OtpResult<KeyBytes>::ok(std::move(key));
}

OtpResult<KeyBytes> KeyCodec::generate(std::size_t length) {
    if (length == 0 || length > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return OtpResult<KeyBytes>::err(
            OtpError(ErrorCode::InvalidArgument, "invalid key length"));
    }
    KeyBytes key(length);
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        auto code = ERR_get_error();
        char reason[256] = {};
        ERR_error_string_n(code, reason, sizeof(reason));
        OTPM_LOG_ERROR(LogCategory::Token, std::string("RAND_bytes failed: ") + reason);
        return OtpResult<KeyBytes>::err(
            OtpError(ErrorCode::KeyGenerationFailed, "failed to generate random key"));
    }
    return OtpResult<KeyBytes>::ok(std::move(key));
}

}  // namespace otpm::token
