/// @file service_runner.cpp
/// @brief Implementation of shared executable utilities.

#include "otpm/service/service_runner.hpp"

#include <cstdlib>
#include <string_view>

namespace otpm::service {

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath) {
    if (!cliPath.empty()) {
        return cliPath;
    }
    const char* envPath = std::getenv("OTPM_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        return envPath;
    }
    return kDefaultConfigPath;
}

otpm::foundation::OtpResult<void>
loadConfig(otpm::foundation::ConfigManager& config, const std::filesystem::path& cliPath) {
    return config.load(resolveConfigPath(cliPath));
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace otpm::service
