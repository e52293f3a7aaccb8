#pragma once

/// @file otp_logger.hpp
/// @brief OtpLogger wrapping kcenon logger_system for structured token logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "otpm/foundation/otp_result.hpp"

namespace otpm::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core         = 0, ///< Manager lifecycle
    Token        = 1, ///< Key material and schema resolution
    Owner        = 2, ///< Owner/manager resolution
    Provisioning = 3, ///< Provisioning URI construction
    Search       = 4, ///< Search filter handling
    Sync         = 5, ///< Token resynchronization
    Config       = 6, ///< Configuration loading
    Store        = 7  ///< Record store access
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Token", "Owner", "Provisioning", "Search", "Sync", "Config", "Store"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Never put key material, passwords or OTP codes in here.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.tokenId = "a93db710-a31a-4639-8647-f15b2c70b78a";
///   ctx.extra["type"] = "totp";
///   logger.logWithContext(LogLevel::Info, LogCategory::Core,
///                         "Token created", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> tokenId;
    std::optional<std::string> owner;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category     | Default Level |
/// |--------------|---------------|
/// | Core         | Info          |
/// | Token        | Info          |
/// | Owner        | Info          |
/// | Provisioning | Info          |
/// | Search       | Debug         |
/// | Sync         | Info          |
/// | Config       | Info          |
/// | Store        | Warning       |
class OtpLogger {
public:
    OtpLogger();
    ~OtpLogger();

    OtpLogger(const OtpLogger&) = delete;
    OtpLogger& operator=(const OtpLogger&) = delete;
    OtpLogger(OtpLogger&&) noexcept;
    OtpLogger& operator=(OtpLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    OtpResult<void> flush();

    /// Process-wide instance used by the OTPM_LOG macros.
    static OtpLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse a level name ("debug", "INFO", ...). Unknown names yield nullopt.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace otpm::foundation

// ---------------------------------------------------------------------------
// Convenience macros (macros are global)
// ---------------------------------------------------------------------------

/// OTPM_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef OTPM_MIN_LOG_LEVEL
    #define OTPM_MIN_LOG_LEVEL 0
#endif

#define OTPM_LOG(level, cat, msg)                                                 \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= OTPM_MIN_LOG_LEVEL &&                      \
            ::otpm::foundation::OtpLogger::instance().isEnabled((level), (cat)))   \
        {                                                                         \
            ::otpm::foundation::OtpLogger::instance().log((level), (cat), (msg));  \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define OTPM_LOG_DEBUG(cat, msg) \
    OTPM_LOG(::otpm::foundation::LogLevel::Debug, (cat), (msg))

#define OTPM_LOG_INFO(cat, msg) \
    OTPM_LOG(::otpm::foundation::LogLevel::Info, (cat), (msg))

#define OTPM_LOG_WARN(cat, msg) \
    OTPM_LOG(::otpm::foundation::LogLevel::Warning, (cat), (msg))

#define OTPM_LOG_ERROR(cat, msg) \
    OTPM_LOG(::otpm::foundation::LogLevel::Error, (cat), (msg))
