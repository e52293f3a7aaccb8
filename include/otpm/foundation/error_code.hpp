#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the OTP token manager.

#include <cstdint>
#include <string_view>

namespace otpm::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Token (0x0100 - 0x01FF)
    KeyMismatch = 0x0100,
    KeyEncodingInvalid = 0x0101,
    KeyGenerationFailed = 0x0102,
    UnknownTokenType = 0x0103,
    ValidationFailed = 0x0104,
    TokenNotFound = 0x0105,
    TokenAlreadyExists = 0x0106,
    NoModifications = 0x0107,

    // Identity (0x0200 - 0x02FF)
    OwnerNotFound = 0x0200,
    UserNotFound = 0x0201,

    // Store (0x0300 - 0x03FF)
    StoreUnavailable = 0x0301,
    InvalidFilter = 0x0302,
    MalformedRecord = 0x0303,

    // Sync (0x0400 - 0x04FF)
    SyncTransportFailed = 0x0400,
    InsecureSyncEndpoint = 0x0401,
    InvalidSyncUri = 0x0402,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalid = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Token";
        case 0x0200: return "Identity";
        case 0x0300: return "Store";
        case 0x0400: return "Sync";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace otpm::foundation
