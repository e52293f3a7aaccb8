/// @file main.cpp
/// @brief Token enrollment service entry point.
///
/// Standalone executable that builds a TokenManager over in-memory
/// collaborators, enrolls one token for the configured bootstrap user and
/// prints its provisioning URI. Suitable for development and testing.

#include "otpm/foundation/config_manager.hpp"
#include "otpm/foundation/otp_logger.hpp"
#include "otpm/service/service_runner.hpp"
#include "otpm/token/in_memory_directory.hpp"
#include "otpm/token/manager_config.hpp"
#include "otpm/token/token_manager.hpp"
#include "otpm/version.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

using otpm::foundation::LogCategory;
using otpm::foundation::OtpLogger;

bool applyLogLevel(const otpm::foundation::ConfigManager& config) {
    auto level = config.get<std::string>("logging.level");
    if (!level) {
        return true;
    }
    auto parsed = otpm::foundation::parseLogLevel(level.value());
    if (!parsed) {
        std::cerr << "Unknown logging.level '" << level.value() << "'\n";
        return false;
    }
    for (std::size_t i = 0; i < otpm::foundation::kLogCategoryCount; ++i) {
        OtpLogger::instance().setCategoryLevel(static_cast<LogCategory>(i), *parsed);
    }
    return true;
}

otpm::token::CreateRequest buildBootstrapRequest(const otpm::foundation::ConfigManager& config) {
    otpm::token::CreateRequest request;

    auto type = config.get<std::string>("bootstrap.type");
    if (type) {
        request.type = std::move(type).value();
    }

    auto description = config.get<std::string>("bootstrap.description");
    if (description) {
        request.info["description"] = std::move(description).value();
    }

    return request;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Config path: --config flag > OTPM_CONFIG_PATH env > default.
    auto cliPath = otpm::service::parseConfigArg(argc, argv);
    auto configPath = otpm::service::resolveConfigPath(cliPath);

    otpm::foundation::ConfigManager config;
    auto loadResult = otpm::service::loadConfig(config, cliPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (!applyLogLevel(config)) {
        return EXIT_FAILURE;
    }

    auto managerConfig = otpm::token::loadManagerConfig(config);
    if (!managerConfig) {
        std::cerr << "Invalid configuration: " << managerConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto user = config.get<std::string>("bootstrap.user");
    if (!user) {
        std::cerr << "Missing bootstrap.user: " << user.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto principal = config.getOr<std::string>(
        "bootstrap.principal", user.value() + "@" + managerConfig.value().realm);
    if (!principal) {
        std::cerr << "Invalid bootstrap.principal: " << principal.error().message() << "\n";
        return EXIT_FAILURE;
    }

    // In-memory backends for standalone development mode.
    auto directory = std::make_shared<otpm::token::InMemoryDirectory>(managerConfig.value().layout);
    directory->addUser(user.value(), principal.value());
    directory->setCurrentUser(user.value());

    otpm::token::TokenManager manager(std::move(managerConfig).value(), directory, directory);

    auto created = manager.create(buildBootstrapRequest(config));
    if (!created) {
        std::cerr << "Failed to enroll token: " << created.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "otpm tokend " << OTPM_VERSION_STRING << " (config: " << configPath.string()
              << ")\n"
              << "Added OTP token \"" << created.value().token.id << "\"\n"
              << "URI: " << created.value().uri << "\n";

    auto flushed = OtpLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
