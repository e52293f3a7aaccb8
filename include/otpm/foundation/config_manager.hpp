#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "otpm/foundation/otp_result.hpp"

namespace otpm::foundation {

/// YAML configuration manager.
///
/// Loads from a file or an in-memory document and exposes leaf values by
/// dotted key (e.g. "otp.realm"). The YAML tree is flattened on load to
/// avoid yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous content.
    /// @return Success or ConfigLoadFailed error.
    OtpResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text.
    OtpResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    OtpResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, falling back to @p fallback when the key is
    /// absent. A present key of the wrong type is still an error.
    template <typename T>
    OtpResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    OtpResult<void> replaceWith(const YAML::Node& root);

    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
OtpResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return OtpResult<T>::err(
            OtpError(ErrorCode::ConfigKeyNotFound,
                     std::string("config key not found: ") + std::string(key)));
    }
    try {
        return OtpResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return OtpResult<T>::err(
            OtpError(ErrorCode::ConfigTypeMismatch,
                     std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
OtpResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasError() && result.error().code() == ErrorCode::ConfigKeyNotFound) {
        return OtpResult<T>::ok(std::move(fallback));
    }
    return result;
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace otpm::foundation
