#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for otpm executables: configuration path
/// resolution and loading.

#include <filesystem>

#include "otpm/foundation/config_manager.hpp"
#include "otpm/foundation/otp_result.hpp"

namespace otpm::service {

/// Default configuration file used when neither --config nor
/// OTPM_CONFIG_PATH is given.
inline constexpr const char* kDefaultConfigPath = "/etc/otpm/config.yaml";

/// Pick the configuration file to load.
///
/// Resolved in order:
///   1. @p cliPath (from --config), if not empty
///   2. OTPM_CONFIG_PATH environment variable, if set
///   3. kDefaultConfigPath
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath);

/// Load the file chosen by resolveConfigPath() into @p config.
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] otpm::foundation::OtpResult<void>
loadConfig(otpm::foundation::ConfigManager& config, const std::filesystem::path& cliPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

} // namespace otpm::service
