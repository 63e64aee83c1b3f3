// src/marketdata/field_coercion.cpp

#include "optwatch/marketdata/field_coercion.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace optwatch {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

bool FieldCoercion::is_sentinel(const std::string& text) {
    const std::string trimmed = trim(text);
    return trimmed.empty() || trimmed == "N/A";
}

double FieldCoercion::to_double(const std::string& text, double default_value) {
    if (is_sentinel(text)) {
        return default_value;
    }

    const std::string trimmed = trim(text);
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (end == trimmed.c_str() || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        return default_value;
    }
    return value;
}

Count FieldCoercion::truncate_to_count(double value, Count default_value) {
    if (!std::isfinite(value)) {
        return default_value;
    }
    const double truncated = std::trunc(value);
    if (truncated < static_cast<double>(std::numeric_limits<Count>::min()) ||
        truncated >= static_cast<double>(std::numeric_limits<Count>::max())) {
        return default_value;
    }
    return static_cast<Count>(truncated);
}

Count FieldCoercion::to_count(const std::string& text, Count default_value) {
    if (is_sentinel(text)) {
        return default_value;
    }
    const double nan = std::numeric_limits<double>::quiet_NaN();
    return truncate_to_count(to_double(text, nan), default_value);
}

double FieldCoercion::json_double(const nlohmann::json& value, double default_value) {
    if (value.is_number()) {
        const double number = value.get<double>();
        return std::isfinite(number) ? number : default_value;
    }
    if (value.is_string()) {
        return to_double(value.get<std::string>(), default_value);
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? 1.0 : 0.0;
    }
    return default_value;
}

Count FieldCoercion::json_count(const nlohmann::json& value, Count default_value) {
    if (value.is_number_integer()) {
        return value.get<Count>();
    }
    if (value.is_number()) {
        return truncate_to_count(value.get<double>(), default_value);
    }
    if (value.is_string()) {
        return to_count(value.get<std::string>(), default_value);
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? 1 : 0;
    }
    return default_value;
}

std::string FieldCoercion::json_string(const nlohmann::json& value,
                                     const std::string& default_value) {
    if (value.is_null()) {
        return default_value;
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

double FieldCoercion::cell_double(const std::shared_ptr<arrow::Array>& array, int64_t index,
                                  double default_value) {
    if (!array || index < 0 || index >= array->length() || array->IsNull(index)) {
        return default_value;
    }

    switch (array->type_id()) {
        case arrow::Type::DOUBLE: {
            const double value = std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index);
            return std::isfinite(value) ? value : default_value;
        }
        case arrow::Type::INT64:
            return static_cast<double>(
                std::static_pointer_cast<arrow::Int64Array>(array)->Value(index));
        case arrow::Type::INT32:
            return static_cast<double>(
                std::static_pointer_cast<arrow::Int32Array>(array)->Value(index));
        case arrow::Type::STRING:
            return to_double(std::static_pointer_cast<arrow::StringArray>(array)->GetString(index),
                             default_value);
        default:
            return default_value;
    }
}

Count FieldCoercion::cell_count(const std::shared_ptr<arrow::Array>& array, int64_t index,
                                Count default_value) {
    if (!array || index < 0 || index >= array->length() || array->IsNull(index)) {
        return default_value;
    }

    switch (array->type_id()) {
        case arrow::Type::INT64:
            return std::static_pointer_cast<arrow::Int64Array>(array)->Value(index);
        case arrow::Type::INT32:
            return std::static_pointer_cast<arrow::Int32Array>(array)->Value(index);
        case arrow::Type::DOUBLE:
            return truncate_to_count(
                std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index), default_value);
        case arrow::Type::STRING:
            return to_count(std::static_pointer_cast<arrow::StringArray>(array)->GetString(index),
                            default_value);
        default:
            return default_value;
    }
}

std::string FieldCoercion::cell_string(const std::shared_ptr<arrow::Array>& array, int64_t index,
                                       const std::string& default_value) {
    if (!array || index < 0 || index >= array->length() || array->IsNull(index)) {
        return default_value;
    }

    if (array->type_id() == arrow::Type::STRING) {
        return std::static_pointer_cast<arrow::StringArray>(array)->GetString(index);
    }

    auto scalar = array->GetScalar(index);
    if (!scalar.ok()) {
        return default_value;
    }
    return (*scalar)->ToString();
}

}  // namespace optwatch
