// tests/mocks/arrow_tables.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace optwatch {
namespace testing {

inline void check_status(const arrow::Status& status) {
    if (!status.ok()) {
        throw std::runtime_error("Arrow error: " + status.ToString());
    }
}

inline std::shared_ptr<arrow::Array> string_array(const std::vector<std::string>& values) {
    arrow::StringBuilder builder;
    for (const auto& value : values) {
        check_status(builder.Append(value));
    }
    std::shared_ptr<arrow::Array> array;
    check_status(builder.Finish(&array));
    return array;
}

inline std::shared_ptr<arrow::Array> double_array(const std::vector<double>& values) {
    arrow::DoubleBuilder builder;
    for (double value : values) {
        check_status(builder.Append(value));
    }
    std::shared_ptr<arrow::Array> array;
    check_status(builder.Finish(&array));
    return array;
}

inline std::shared_ptr<arrow::Array> int64_array(const std::vector<int64_t>& values) {
    arrow::Int64Builder builder;
    for (int64_t value : values) {
        check_status(builder.Append(value));
    }
    std::shared_ptr<arrow::Array> array;
    check_status(builder.Finish(&array));
    return array;
}

using NamedColumn = std::pair<std::string, std::shared_ptr<arrow::Array>>;

inline std::shared_ptr<arrow::Table> make_table(const std::vector<NamedColumn>& columns) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    for (const auto& [name, array] : columns) {
        fields.push_back(arrow::field(name, array->type()));
        arrays.push_back(array);
    }
    return arrow::Table::Make(arrow::schema(fields), arrays);
}

inline std::shared_ptr<arrow::Table> empty_table() {
    return make_table({{"code", string_array({})}});
}

}  // namespace testing
}  // namespace optwatch
