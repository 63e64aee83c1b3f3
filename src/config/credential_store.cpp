// src/config/credential_store.cpp
#include "optwatch/config/credential_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include "optwatch/core/logger.hpp"

namespace optwatch {

CredentialStore::CredentialStore(const std::string& path) : config_path_(path) {
    const char* env_config = std::getenv("OPTWATCH_CONFIG_PATH");
    if (env_config) {
        std::filesystem::path env_path(env_config);
        if (env_path.extension() == ".json" && env_path.string().length() < 512) {
            config_path_ = env_config;
        }
    }

    init_validation_patterns();

    auto load_result = load_config();
    if (load_result.is_error()) {
        throw std::runtime_error("Failed to load config: " +
                                 std::string(load_result.error()->what()));
    }
}

void CredentialStore::init_validation_patterns() {
    // Database connection patterns
    validation_patterns_["host"] = R"(^[a-zA-Z0-9.-]+$)";
    validation_patterns_["port"] = R"(^[1-9][0-9]{0,4}$)";
    validation_patterns_["username"] = R"(^[a-zA-Z0-9_-]{1,64}$)";
    validation_patterns_["name"] = R"(^[a-zA-Z0-9_-]{1,64}$)";

    // Webhook and gateway endpoints
    validation_patterns_["url"] = R"(^https?://[^\s]+$)";
}

Result<void> CredentialStore::load_config() {
    if (!std::filesystem::exists(config_path_)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + config_path_,
                                "CredentialStore");
    }

    std::error_code ec;
    auto perms = std::filesystem::status(config_path_, ec).permissions();
    if (ec) {
        WARN("Could not check permissions of " + config_path_ + ": " + ec.message());
    } else if ((perms & std::filesystem::perms::others_read) != std::filesystem::perms::none) {
        WARN("Config file is world-readable: " + config_path_);
    }

    std::ifstream config_file(config_path_);
    if (!config_file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open config file: " + config_path_, "CredentialStore");
    }

    try {
        config_file >> config_;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Failed to parse config file: " + std::string(e.what()),
                                "CredentialStore");
    }

    return Result<void>();
}

Result<void> CredentialStore::validate_credential(const std::string& key,
                                                  const std::string& value) const {
    auto it = validation_patterns_.find(key);
    if (it != validation_patterns_.end()) {
        std::regex pattern(it->second);
        if (!std::regex_match(value, pattern)) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid format for credential: " + key, "CredentialStore");
        }
    }

    if (value.length() > 512) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Credential value too long: " + key,
                                "CredentialStore");
    }

    return Result<void>();
}

Result<void> CredentialStore::validate_names(const std::string& section,
                                             const std::string& key) const {
    static const std::regex name_pattern(R"(^[a-zA-Z0-9_]{1,64}$)");
    if (!std::regex_match(section, name_pattern)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Invalid section name: " + section,
                                "CredentialStore");
    }
    if (!std::regex_match(key, name_pattern)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Invalid key name: " + key,
                                "CredentialStore");
    }
    return Result<void>();
}

Result<std::string> CredentialStore::get_credential(const std::string& section,
                                                    const std::string& key) const {
    auto value = get<std::string>(section, key);
    if (value.is_error()) {
        return value;
    }

    auto check = validate_credential(key, value.value());
    if (check.is_error()) {
        return make_error<std::string>(check.error()->code(), check.error()->what(),
                                       "CredentialStore");
    }
    return value;
}

bool CredentialStore::has_credential(const std::string& section, const std::string& key) const {
    if (validate_names(section, key).is_error()) {
        return false;
    }
    return config_.contains(section) && config_[section].contains(key);
}

}  // namespace optwatch
