// include/optwatch/core/holiday_checker.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include "optwatch/core/error.hpp"
#include "optwatch/core/logger.hpp"

namespace optwatch {

/**
 * @brief Holiday information structure
 */
struct HolidayInfo {
    std::string date;
    std::string name;
    std::string type;
    std::string note;
};

/**
 * @brief Exchange holiday lookup backed by a JSON file
 *
 * File layout: { "2025": [ {"date": "2025-12-25", "name": "...", "type": "..."} ] }
 */
class HolidayChecker {
public:
    HolidayChecker() = default;

    /**
     * @brief Load from a file, logging and keeping an empty table on failure
     * @param json_path Path to the holidays file
     */
    explicit HolidayChecker(const std::string& json_path) {
        auto loaded = load_file(json_path);
        if (loaded.is_error()) {
            ERROR("Failed to load holidays from " << json_path << ": "
                                                  << loaded.error()->what());
        }
    }

    bool is_holiday(const std::string& date) const {
        return holidays_.find(date) != holidays_.end();
    }

    std::optional<HolidayInfo> get_holiday_info(const std::string& date) const {
        auto it = holidays_.find(date);
        if (it != holidays_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string get_holiday_name(const std::string& date) const {
        auto it = holidays_.find(date);
        return it != holidays_.end() ? it->second.name : "";
    }

    size_t size() const {
        return holidays_.size();
    }

    void add_holiday(const HolidayInfo& info) {
        holidays_[info.date] = info;
    }

    Result<void> load_file(const std::string& json_path) {
        std::ifstream file(json_path);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                    "Could not open holidays file: " + json_path,
                                    "HolidayChecker");
        }

        try {
            nlohmann::json j;
            file >> j;
            return load_json(j);
        } catch (const std::exception& e) {
            return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                    "Malformed holidays file " + json_path + ": " + e.what(),
                                    "HolidayChecker");
        }
    }

    Result<void> load_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Holidays must be an object keyed by year", "HolidayChecker");
        }

        std::unordered_map<std::string, HolidayInfo> loaded;
        try {
            for (auto& [year, holidays_array] : j.items()) {
                for (auto& holiday : holidays_array) {
                    HolidayInfo info;
                    info.date = holiday.at("date").get<std::string>();
                    info.name = holiday.value("name", "");
                    info.type = holiday.value("type", "");
                    info.note = holiday.value("note", "");
                    loaded[info.date] = info;
                }
            }
        } catch (const nlohmann::json::exception& e) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    std::string("Invalid holiday entry: ") + e.what(),
                                    "HolidayChecker");
        }

        holidays_ = std::move(loaded);
        INFO("Loaded " << holidays_.size() << " holidays");
        return Result<void>();
    }

private:
    std::unordered_map<std::string, HolidayInfo> holidays_;
};

}  // namespace optwatch
