#pragma once

/// @file manager_config.hpp
/// @brief TokenManager configuration and its loader from the "otp." keys.

#include "otpm/foundation/config_manager.hpp"
#include "otpm/foundation/otp_result.hpp"
#include "otpm/token/schema_resolver.hpp"
#include "otpm/token/token_store.hpp"

#include <string>

namespace otpm::token {

/// Configuration for TokenManager and TokenSync.
struct ManagerConfig {
    /// Issuer used when the owner's principal name is unavailable.
    std::string realm = "EXAMPLE.COM";

    DirectoryLayout layout;

    /// RPC endpoint of the server; the sync endpoint is derived from it.
    std::string rpcUri = "https://localhost/otpm/xml";

    TokenDefaults defaults;

    std::string syncResultHeader = "X-Token-Sync-Result";
    std::string syncPath = "/session/sync_token";
};

/// Build a ManagerConfig from the "otp." section. Absent keys keep their
/// defaults; present keys of the wrong type or out of range fail with
/// ConfigTypeMismatch or ConfigInvalid.
///
/// Recognized keys:
/// | Key                      | Type   | Default               |
/// |--------------------------|--------|-----------------------|
/// | otp.realm                | string | EXAMPLE.COM           |
/// | otp.base_dn              | string | dc=example,dc=com     |
/// | otp.user_container       | string | cn=users,cn=accounts  |
/// | otp.token_container      | string | cn=otp                |
/// | otp.rpc_uri              | string | https://localhost/otpm/xml |
/// | otp.key_length           | int    | 20 (multiple of 5)    |
/// | otp.default_type         | string | totp                  |
/// | otp.default_algorithm    | string | sha1                  |
/// | otp.default_digits       | int    | 6                     |
/// | otp.default_time_step    | int    | 30                    |
/// | otp.default_clock_offset | int    | 0                     |
/// | otp.default_counter      | int    | 0                     |
/// | otp.sync_result_header   | string | X-Token-Sync-Result   |
/// | otp.sync_path            | string | /session/sync_token   |
[[nodiscard]] foundation::OtpResult<ManagerConfig> loadManagerConfig(
    const foundation::ConfigManager& config);

}  // namespace otpm::token
