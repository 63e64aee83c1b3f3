// src/options/option_code_parser.cpp

#include "optwatch/options/option_code_parser.hpp"
#include <cmath>
#include <cstdio>
#include <regex>

namespace optwatch {

namespace {

const std::regex& code_pattern() {
    static const std::regex pattern(R"(^(HK|US)\.([A-Z][A-Z0-9]*?)(\d{2})(\d{2})(\d{2})([CP])(\d+)$)");
    return pattern;
}

constexpr double kStrikeScale = 1000.0;
constexpr size_t kMaxStrikeDigits = 15;

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0)) {
        return 29;
    }
    return days[month - 1];
}

}  // namespace

ParsedOptionCode OptionCodeParser::parse(const std::string& code) {
    std::smatch match;
    if (!std::regex_match(code, match, code_pattern())) {
        return ParsedOptionCode{};
    }

    const std::string strike_digits = match[7].str();
    if (strike_digits.size() > kMaxStrikeDigits) {
        return ParsedOptionCode{};
    }

    const int year = 2000 + std::stoi(match[3].str());
    const int month = std::stoi(match[4].str());
    const int day = std::stoi(match[5].str());
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return ParsedOptionCode{};
    }

    ParsedOptionCode parsed;
    if (!market_from_string(match[1].str(), parsed.market)) {
        return ParsedOptionCode{};
    }
    parsed.underlying = match[2].str();
    parsed.option_class = match[6].str() == "C" ? OptionClass::CALL : OptionClass::PUT;
    parsed.strike_price = static_cast<double>(std::stoll(strike_digits)) / kStrikeScale;

    char expiry[16];
    std::snprintf(expiry, sizeof(expiry), "%04d-%02d-%02d", year, month, day);
    parsed.expiry_date = expiry;
    parsed.is_valid = true;
    return parsed;
}

std::string OptionCodeParser::format_strike(Price strike, size_t width) {
    const long long scaled = std::llround(strike * kStrikeScale);
    std::string digits = std::to_string(scaled < 0 ? 0 : scaled);
    if (digits.size() < width) {
        digits.insert(0, width - digits.size(), '0');
    }
    return digits;
}

std::string OptionCodeParser::format_code(Market market, const std::string& ticker,
                                          const std::string& expiry_date,
                                          OptionClass option_class, Price strike,
                                          size_t strike_width) {
    int year = 0;
    int month = 0;
    int day = 0;
    if (std::sscanf(expiry_date.c_str(), "%4d-%2d-%2d", &year, &month, &day) != 3 ||
        year < 2000 || year > 2099) {
        return "";
    }
    if (option_class == OptionClass::UNKNOWN) {
        return "";
    }

    char date_part[8];
    std::snprintf(date_part, sizeof(date_part), "%02d%02d%02d", year - 2000, month, day);

    return market_to_string(market) + "." + ticker + date_part +
           (option_class == OptionClass::CALL ? "C" : "P") + format_strike(strike, strike_width);
}

}  // namespace optwatch
