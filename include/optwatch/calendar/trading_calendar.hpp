// include/optwatch/calendar/trading_calendar.hpp
#pragma once

#include <chrono>
#include <ctime>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "optwatch/core/error.hpp"
#include "optwatch/core/holiday_checker.hpp"
#include "optwatch/core/types.hpp"

namespace optwatch {

/**
 * @brief Continuous trading window in exchange-local minutes after midnight
 */
struct TradingSession {
    int open_minute{0};
    int close_minute{0};  // exclusive

    /**
     * @brief Parse "HH:MM-HH:MM"
     */
    static Result<TradingSession> parse(const std::string& text);
    std::string to_string() const;
};

enum class DstRule {
    NONE,
    US  // second Sunday of March 02:00 to first Sunday of November 02:00
};

struct CalendarSettings {
    std::vector<TradingSession> sessions;
    std::chrono::minutes standard_utc_offset{0};
    DstRule dst_rule{DstRule::NONE};
    std::string holiday_file;

    static CalendarSettings hong_kong();
    static CalendarSettings united_states();

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Exchange clock of one market: local time, sessions, weekends, holidays
 */
class TradingCalendar {
public:
    explicit TradingCalendar(CalendarSettings settings,
                             std::shared_ptr<const HolidayChecker> holidays = nullptr);

    std::chrono::minutes utc_offset_at(const Timestamp& when) const;

    std::tm local_time(const Timestamp& when) const;

    /**
     * @brief Exchange-local date, YYYY-MM-DD
     */
    std::string trading_day_key(const Timestamp& when) const;

    bool is_trading_day(const Timestamp& when) const;

    bool is_trading_time(const Timestamp& when) const;

    /**
     * @brief Short human-readable state for status lines
     */
    std::string describe(const Timestamp& when) const;

    const CalendarSettings& settings() const {
        return settings_;
    }

private:
    static bool is_us_dst(long local_standard_minutes);

    CalendarSettings settings_;
    std::shared_ptr<const HolidayChecker> holidays_;
};

}  // namespace optwatch
