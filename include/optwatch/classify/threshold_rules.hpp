// include/optwatch/classify/threshold_rules.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "optwatch/core/config_base.hpp"
#include "optwatch/core/types.hpp"

namespace optwatch {

/**
 * @brief Rule families, chosen from the underlying's identity
 */
enum class RuleKey {
    HSI_OPTIONS,    // Hang Seng Index, HK.800000
    HSCEI_OPTIONS,  // Hang Seng China Enterprises Index, HK.800700
    US_DEFAULT,     // any US underlying
    HK_DEFAULT      // any other HK underlying
};

std::string rule_key_to_string(RuleKey key);
bool rule_key_from_string(const std::string& text, RuleKey& out);

/**
 * @brief Select the rule family for an underlying
 * @param market Market the underlying trades in
 * @param underlying_code Full code, e.g. "HK.800000"
 */
RuleKey select_rule_key(Market market, const std::string& underlying_code);

struct ThresholdRule {
    Count min_volume{0};
    double min_turnover{0.0};
    Count min_volume_delta{0};
    double strike_range_fraction{0.4};

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Threshold rule per family, loaded from the "thresholds" config section
 *
 * JSON keys per family: min_volume, min_turnover, min_volume_diff, price_range.
 */
class ThresholdTable : public ConfigBase {
public:
    ThresholdTable();

    const ThresholdRule& rule(RuleKey key) const;
    const ThresholdRule& rule_for(Market market, const std::string& underlying_code) const;
    void set_rule(RuleKey key, const ThresholdRule& rule);

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

private:
    std::map<RuleKey, ThresholdRule> rules_;
};

}  // namespace optwatch
