// src/classify/threshold_rules.cpp

#include "optwatch/classify/threshold_rules.hpp"
#include <stdexcept>

namespace optwatch {

namespace {
const char* const kHsiUnderlying = "HK.800000";
const char* const kHsceiUnderlying = "HK.800700";
}  // namespace

std::string rule_key_to_string(RuleKey key) {
    switch (key) {
        case RuleKey::HSI_OPTIONS:
            return "hsi_options";
        case RuleKey::HSCEI_OPTIONS:
            return "hscei_options";
        case RuleKey::US_DEFAULT:
            return "us_default";
        case RuleKey::HK_DEFAULT:
            return "hk_default";
        default:
            return "hk_default";
    }
}

bool rule_key_from_string(const std::string& text, RuleKey& out) {
    for (RuleKey key : {RuleKey::HSI_OPTIONS, RuleKey::HSCEI_OPTIONS, RuleKey::US_DEFAULT,
                        RuleKey::HK_DEFAULT}) {
        if (rule_key_to_string(key) == text) {
            out = key;
            return true;
        }
    }
    return false;
}

RuleKey select_rule_key(Market market, const std::string& underlying_code) {
    if (underlying_code == kHsiUnderlying) {
        return RuleKey::HSI_OPTIONS;
    }
    if (underlying_code == kHsceiUnderlying) {
        return RuleKey::HSCEI_OPTIONS;
    }
    if (market == Market::US) {
        return RuleKey::US_DEFAULT;
    }
    return RuleKey::HK_DEFAULT;
}

nlohmann::json ThresholdRule::to_json() const {
    nlohmann::json j;
    j["min_volume"] = min_volume;
    j["min_turnover"] = min_turnover;
    j["min_volume_diff"] = min_volume_delta;
    j["price_range"] = strike_range_fraction;
    return j;
}

void ThresholdRule::from_json(const nlohmann::json& j) {
    if (j.contains("min_volume"))
        min_volume = j.at("min_volume").get<Count>();
    if (j.contains("min_turnover"))
        min_turnover = j.at("min_turnover").get<double>();
    if (j.contains("min_volume_diff"))
        min_volume_delta = j.at("min_volume_diff").get<Count>();
    if (j.contains("price_range"))
        strike_range_fraction = j.at("price_range").get<double>();
}

ThresholdTable::ThresholdTable() {
    rules_[RuleKey::HSI_OPTIONS] = ThresholdRule{100, 500000.0, 50, 0.1};
    rules_[RuleKey::HSCEI_OPTIONS] = ThresholdRule{100, 300000.0, 50, 0.1};
    rules_[RuleKey::US_DEFAULT] = ThresholdRule{50, 50000.0, 20, 0.4};
    rules_[RuleKey::HK_DEFAULT] = ThresholdRule{10, 50000.0, 10, 0.4};
}

const ThresholdRule& ThresholdTable::rule(RuleKey key) const {
    return rules_.at(key);
}

const ThresholdRule& ThresholdTable::rule_for(Market market,
                                              const std::string& underlying_code) const {
    return rule(select_rule_key(market, underlying_code));
}

void ThresholdTable::set_rule(RuleKey key, const ThresholdRule& rule) {
    rules_[key] = rule;
}

nlohmann::json ThresholdTable::to_json() const {
    nlohmann::json j;
    for (const auto& [key, rule] : rules_) {
        j[rule_key_to_string(key)] = rule.to_json();
    }
    return j;
}

void ThresholdTable::from_json(const nlohmann::json& j) {
    for (const auto& item : j.items()) {
        RuleKey key;
        if (!rule_key_from_string(item.key(), key)) {
            throw std::invalid_argument("Unknown threshold family: " + item.key());
        }
        // Unspecified fields keep their defaults
        rules_[key].from_json(item.value());
    }
}

}  // namespace optwatch
