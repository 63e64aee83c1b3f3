// include/optwatch/config/credential_store.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include "optwatch/core/error.hpp"

namespace optwatch {

/**
 * @brief Read-only access to the monitor's JSON configuration file
 *
 * Holds database credentials and webhook secrets next to the monitor
 * settings. OPTWATCH_CONFIG_PATH overrides the constructor path when it
 * names a .json file.
 */
class CredentialStore {
public:
    explicit CredentialStore(const std::string& path = "config.json");

    /**
     * @brief Load or reload configuration from file
     * @return Result indicating success or failure
     */
    Result<void> load_config();

    /**
     * @brief Get a string credential, checked against its format pattern
     */
    Result<std::string> get_credential(const std::string& section, const std::string& key) const;

    template <typename T>
    Result<T> get(const std::string& section, const std::string& key) const;

    template <typename T>
    T get_with_default(const std::string& section, const std::string& key,
                       const T& default_value) const;

    bool has_credential(const std::string& section, const std::string& key) const;

    const nlohmann::json& document() const {
        return config_;
    }

    const std::string& path() const {
        return config_path_;
    }

private:
    nlohmann::json config_;
    std::string config_path_;
    std::unordered_map<std::string, std::string> validation_patterns_;

    void init_validation_patterns();
    Result<void> validate_credential(const std::string& key, const std::string& value) const;
    Result<void> validate_names(const std::string& section, const std::string& key) const;
};

template <typename T>
Result<T> CredentialStore::get(const std::string& section, const std::string& key) const {
    auto name_validation = validate_names(section, key);
    if (name_validation.is_error()) {
        return make_error<T>(name_validation.error()->code(), name_validation.error()->what(),
                             "CredentialStore");
    }

    if (!config_.contains(section) || !config_[section].contains(key)) {
        return make_error<T>(ErrorCode::DATA_NOT_FOUND,
                             "Configuration not found: " + section + "." + key, "CredentialStore");
    }

    try {
        return Result<T>(config_[section][key].template get<T>());
    } catch (const std::exception& e) {
        return make_error<T>(ErrorCode::CONVERSION_ERROR,
                             "Failed to convert configuration value: " + std::string(e.what()),
                             "CredentialStore");
    }
}

template <typename T>
T CredentialStore::get_with_default(const std::string& section, const std::string& key,
                                    const T& default_value) const {
    auto result = get<T>(section, key);
    return result.is_error() ? default_value : result.value();
}

}  // namespace optwatch
