// src/calendar/trading_calendar.cpp

#include "optwatch/calendar/trading_calendar.hpp"
#include <cstdio>
#include <stdexcept>
#include "optwatch/core/time_utils.hpp"

namespace optwatch {

namespace {

constexpr long kMinutesPerDay = 24 * 60;

// 0 = Sunday
int weekday_from_days(long days) {
    long wd = (days + 4) % 7;
    return static_cast<int>(wd < 0 ? wd + 7 : wd);
}

long nth_sunday(int year, unsigned month, int nth) {
    const long first = core::days_from_civil(year, month, 1);
    const int offset = (7 - weekday_from_days(first)) % 7;
    return first + offset + 7L * (nth - 1);
}

long floor_div(long a, long b) {
    long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

}  // namespace

Result<TradingSession> TradingSession::parse(const std::string& text) {
    int oh = 0, om = 0, ch = 0, cm = 0;
    char trailing = 0;
    if (std::sscanf(text.c_str(), "%d:%d-%d:%d%c", &oh, &om, &ch, &cm, &trailing) != 4 ||
        oh < 0 || oh > 24 || ch < 0 || ch > 24 || om < 0 || om > 59 || cm < 0 || cm > 59) {
        return make_error<TradingSession>(ErrorCode::CONFIG_ERROR,
                                          "Invalid trading session: " + text, "TradingCalendar");
    }

    TradingSession session{oh * 60 + om, ch * 60 + cm};
    if (session.close_minute <= session.open_minute) {
        return make_error<TradingSession>(ErrorCode::CONFIG_ERROR,
                                          "Trading session closes before it opens: " + text,
                                          "TradingCalendar");
    }
    return Result<TradingSession>(session);
}

std::string TradingSession::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d-%02d:%02d", open_minute / 60,
                  open_minute % 60, close_minute / 60, close_minute % 60);
    return std::string(buffer);
}

CalendarSettings CalendarSettings::hong_kong() {
    CalendarSettings settings;
    settings.sessions = {TradingSession{9 * 60 + 30, 12 * 60}, TradingSession{13 * 60, 16 * 60}};
    settings.standard_utc_offset = std::chrono::hours(8);
    settings.dst_rule = DstRule::NONE;
    return settings;
}

CalendarSettings CalendarSettings::united_states() {
    CalendarSettings settings;
    settings.sessions = {TradingSession{9 * 60 + 30, 16 * 60}};
    settings.standard_utc_offset = std::chrono::hours(-5);
    settings.dst_rule = DstRule::US;
    return settings;
}

nlohmann::json CalendarSettings::to_json() const {
    nlohmann::json j;
    std::vector<std::string> session_text;
    for (const auto& session : sessions) {
        session_text.push_back(session.to_string());
    }
    j["sessions"] = session_text;
    j["utc_offset_minutes"] = standard_utc_offset.count();
    j["dst_rule"] = dst_rule == DstRule::US ? "US" : "NONE";
    j["holiday_file"] = holiday_file;
    return j;
}

void CalendarSettings::from_json(const nlohmann::json& j) {
    if (j.contains("sessions")) {
        std::vector<TradingSession> parsed;
        for (const auto& text : j.at("sessions")) {
            auto session = TradingSession::parse(text.get<std::string>());
            if (session.is_error()) {
                throw std::invalid_argument(session.error()->what());
            }
            parsed.push_back(session.value());
        }
        sessions = std::move(parsed);
    }
    if (j.contains("utc_offset_minutes"))
        standard_utc_offset = std::chrono::minutes(j.at("utc_offset_minutes").get<long>());
    if (j.contains("dst_rule"))
        dst_rule = j.at("dst_rule").get<std::string>() == "US" ? DstRule::US : DstRule::NONE;
    if (j.contains("holiday_file"))
        holiday_file = j.at("holiday_file").get<std::string>();
}

TradingCalendar::TradingCalendar(CalendarSettings settings,
                                 std::shared_ptr<const HolidayChecker> holidays)
    : settings_(std::move(settings)), holidays_(std::move(holidays)) {}

bool TradingCalendar::is_us_dst(long local_standard_minutes) {
    const long days = floor_div(local_standard_minutes, kMinutesPerDay);
    // Recover the civil year from the day count
    std::time_t seconds = static_cast<std::time_t>(days) * 86400;
    std::tm civil{};
    core::safe_gmtime(&seconds, &civil);
    const int year = civil.tm_year + 1900;

    // Transitions at 02:00 local standard time; DST ends at 02:00 daylight = 01:00 standard
    const long start = nth_sunday(year, 3, 2) * kMinutesPerDay + 2 * 60;
    const long end = nth_sunday(year, 11, 1) * kMinutesPerDay + 1 * 60;
    return local_standard_minutes >= start && local_standard_minutes < end;
}

std::chrono::minutes TradingCalendar::utc_offset_at(const Timestamp& when) const {
    if (settings_.dst_rule == DstRule::NONE) {
        return settings_.standard_utc_offset;
    }

    const long utc_minutes = static_cast<long>(
        std::chrono::duration_cast<std::chrono::minutes>(when.time_since_epoch()).count());
    const long local_standard = utc_minutes + settings_.standard_utc_offset.count();
    return is_us_dst(local_standard) ? settings_.standard_utc_offset + std::chrono::hours(1)
                                     : settings_.standard_utc_offset;
}

std::tm TradingCalendar::local_time(const Timestamp& when) const {
    return core::to_market_tm(when, utc_offset_at(when));
}

std::string TradingCalendar::trading_day_key(const Timestamp& when) const {
    return core::format_date(local_time(when));
}

bool TradingCalendar::is_trading_day(const Timestamp& when) const {
    const std::tm local = local_time(when);
    if (local.tm_wday == 0 || local.tm_wday == 6) {
        return false;
    }
    return !(holidays_ && holidays_->is_holiday(core::format_date(local)));
}

bool TradingCalendar::is_trading_time(const Timestamp& when) const {
    if (!is_trading_day(when)) {
        return false;
    }

    const std::tm local = local_time(when);
    const int minute = local.tm_hour * 60 + local.tm_min;
    for (const auto& session : settings_.sessions) {
        if (minute >= session.open_minute && minute < session.close_minute) {
            return true;
        }
    }
    return false;
}

std::string TradingCalendar::describe(const Timestamp& when) const {
    const std::tm local = local_time(when);
    if (local.tm_wday == 0 || local.tm_wday == 6) {
        return "closed (weekend)";
    }
    const std::string date = core::format_date(local);
    if (holidays_ && holidays_->is_holiday(date)) {
        return "closed (holiday: " + holidays_->get_holiday_name(date) + ")";
    }
    return is_trading_time(when) ? "open" : "closed";
}

}  // namespace optwatch
