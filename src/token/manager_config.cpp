/// @file manager_config.cpp
/// @brief ManagerConfig loader.

#include "otpm/token/manager_config.hpp"

#include "otpm/foundation/otp_logger.hpp"

#include <cstdint>

namespace otpm::token {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::OtpError;
using foundation::OtpResult;

namespace {

OtpError invalid(std::string_view key, std::string_view reason) {
    return OtpError(ErrorCode::ConfigInvalid,
                    "invalid value for " + std::string(key) + ": " + std::string(reason));
}

/// Read a string key into @p target, keeping its current value when absent.
OtpResult<void> readString(const ConfigManager& config, std::string_view key,
                           std::string& target) {
    auto value = config.getOr<std::string>(key, target);
    if (value.hasError()) {
        return OtpResult<void>::err(value.error());
    }
    if (value.value().empty()) {
        return OtpResult<void>::err(invalid(key, "must not be empty"));
    }
    target = std::move(value).value();
    return OtpResult<void>::ok();
}

OtpResult<void> readInt(const ConfigManager& config, std::string_view key, int64_t& target) {
    auto value = config.getOr<int64_t>(key, target);
    if (value.hasError()) {
        return OtpResult<void>::err(value.error());
    }
    target = value.value();
    return OtpResult<void>::ok();
}

}  // namespace

OtpResult<ManagerConfig> loadManagerConfig(const ConfigManager& config) {
    ManagerConfig cfg;

    for (auto [key, target] : {std::pair{"otp.realm", &cfg.realm},
                               std::pair{"otp.base_dn", &cfg.layout.baseDn},
                               std::pair{"otp.user_container", &cfg.layout.userContainer},
                               std::pair{"otp.token_container", &cfg.layout.tokenContainer},
                               std::pair{"otp.rpc_uri", &cfg.rpcUri},
                               std::pair{"otp.sync_result_header", &cfg.syncResultHeader},
                               std::pair{"otp.sync_path", &cfg.syncPath}}) {
        auto result = readString(config, key, *target);
        if (result.hasError()) {
            return OtpResult<ManagerConfig>::err(result.error());
        }
    }

    auto& defaults = cfg.defaults;

    std::string type(tokenTypeName(defaults.type));
    std::string algorithm(algorithmName(defaults.algorithm));
    int64_t keyLength = static_cast<int64_t>(defaults.keyLength);
    int64_t digits = defaults.digits;

    for (auto [key, target] : {std::pair{"otp.default_type", &type},
                               std::pair{"otp.default_algorithm", &algorithm}}) {
        auto result = readString(config, key, *target);
        if (result.hasError()) {
            return OtpResult<ManagerConfig>::err(result.error());
        }
    }
    for (auto [key, target] : {std::pair{"otp.key_length", &keyLength},
                               std::pair{"otp.default_digits", &digits},
                               std::pair{"otp.default_time_step", &defaults.timeStep},
                               std::pair{"otp.default_clock_offset", &defaults.clockOffset},
                               std::pair{"otp.default_counter", &defaults.counter}}) {
        auto result = readInt(config, key, *target);
        if (result.hasError()) {
            return OtpResult<ManagerConfig>::err(result.error());
        }
    }

    auto parsedType = parseTokenType(type);
    if (!parsedType) {
        return OtpResult<ManagerConfig>::err(invalid("otp.default_type", "must be totp or hotp"));
    }
    defaults.type = *parsedType;

    auto parsedAlgorithm = parseAlgorithm(algorithm);
    if (!parsedAlgorithm) {
        return OtpResult<ManagerConfig>::err(
            invalid("otp.default_algorithm", "must be one of sha1, sha256, sha384, sha512"));
    }
    defaults.algorithm = *parsedAlgorithm;

    if (keyLength <= 0 || keyLength % 5 != 0) {
        return OtpResult<ManagerConfig>::err(
            invalid("otp.key_length", "must be a positive multiple of 5"));
    }
    defaults.keyLength = static_cast<std::size_t>(keyLength);

    if (digits != 6 && digits != 8) {
        return OtpResult<ManagerConfig>::err(invalid("otp.default_digits", "must be 6 or 8"));
    }
    defaults.digits = static_cast<int>(digits);

    if (defaults.timeStep < kMinTimeStep) {
        return OtpResult<ManagerConfig>::err(
            invalid("otp.default_time_step", "must be at least " + std::to_string(kMinTimeStep)));
    }
    if (defaults.counter < kMinCounter) {
        return OtpResult<ManagerConfig>::err(invalid("otp.default_counter", "must not be negative"));
    }

    OTPM_LOG_DEBUG(LogCategory::Config, "token manager configured for realm " + cfg.realm);
    return OtpResult<ManagerConfig>::ok(std::move(cfg));
}

}  // namespace otpm::token
