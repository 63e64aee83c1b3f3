// include/optwatch/marketdata/field_coercion.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "optwatch/core/types.hpp"

namespace optwatch {

/**
 * @brief Normalizes loosely typed API fields into numbers and strings
 *
 * Missing values, nulls, the "N/A" sentinel, empty strings and anything that
 * does not parse as a finite number collapse to the caller's default. Integer
 * counters accept fractional text ("12.0") and truncate toward zero.
 */
class FieldCoercion {
public:
    static bool is_sentinel(const std::string& text);

    static double to_double(const std::string& text, double default_value = 0.0);
    static Count to_count(const std::string& text, Count default_value = 0);

    static double json_double(const nlohmann::json& value, double default_value = 0.0);
    static Count json_count(const nlohmann::json& value, Count default_value = 0);
    static std::string json_string(const nlohmann::json& value,
                                 const std::string& default_value = "");

    /**
     * @brief Read one cell of an arrow column as a double
     * @param array Column chunk (double, integer or string typed); may be null
     * @param index Row index within the chunk
     */
    static double cell_double(const std::shared_ptr<arrow::Array>& array, int64_t index,
                              double default_value = 0.0);

    static Count cell_count(const std::shared_ptr<arrow::Array>& array, int64_t index,
                            Count default_value = 0);

    static std::string cell_string(const std::shared_ptr<arrow::Array>& array, int64_t index,
                                   const std::string& default_value = "");

private:
    static Count truncate_to_count(double value, Count default_value);
};

}  // namespace optwatch
