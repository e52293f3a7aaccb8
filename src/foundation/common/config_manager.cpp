#include "otpm/foundation/config_manager.hpp"

#include "otpm/foundation/otp_logger.hpp"

namespace otpm::foundation {

OtpResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        auto result = replaceWith(root);
        if (result) {
            OTPM_LOG_INFO(LogCategory::Config, "loaded configuration from " + path.string());
        }
        return result;
    } catch (const YAML::BadFile&) {
        return OtpResult<void>::err(
            OtpError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return OtpResult<void>::err(
            OtpError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

OtpResult<void> ConfigManager::loadString(std::string_view yaml) {
    try {
        return replaceWith(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return OtpResult<void>::err(
            OtpError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

OtpResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return OtpResult<void>::err(
            OtpError(ErrorCode::ConfigLoadFailed, "configuration root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root && root.IsMap()) {
        flatten("", root);
    }
    return OtpResult<void>::ok();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace otpm::foundation
