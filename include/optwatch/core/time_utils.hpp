// include/optwatch/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include "optwatch/core/types.hpp"

namespace optwatch {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result{};

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 */
inline long days_from_civil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const long era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

/**
 * @brief Broken-down wall clock of a market whose offset from UTC is known
 * @param tp Instant to convert
 * @param utc_offset Offset of the market's wall clock from UTC
 */
inline std::tm to_market_tm(const Timestamp& tp, std::chrono::minutes utc_offset) {
    std::time_t shifted = std::chrono::system_clock::to_time_t(tp + utc_offset);
    std::tm result{};
    safe_gmtime(&shifted, &result);
    return result;
}

/**
 * @brief Render the date part of a broken-down time as YYYY-MM-DD
 */
inline std::string format_date(const std::tm& tm) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1,
                  tm.tm_mday);
    return std::string(buffer);
}

/**
 * @brief Parse a YYYY-MM-DD string into days since the epoch
 * @return true on success; out is untouched on failure
 */
inline bool parse_date_days(const std::string& date, long& out) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char trailing = 0;
    if (std::sscanf(date.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &trailing) != 3) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return false;
    }
    out = days_from_civil(year, month, day);
    return true;
}

}  // namespace core
}  // namespace optwatch
