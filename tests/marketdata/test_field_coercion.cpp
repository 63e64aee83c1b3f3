#include <gtest/gtest.h>
#include <limits>
#include "../mocks/arrow_tables.hpp"
#include "optwatch/marketdata/field_coercion.hpp"

using namespace optwatch;
using namespace optwatch::testing;

TEST(FieldCoercionTest, SentinelsCollapseToDefault) {
    EXPECT_TRUE(FieldCoercion::is_sentinel(""));
    EXPECT_TRUE(FieldCoercion::is_sentinel("  N/A "));
    EXPECT_FALSE(FieldCoercion::is_sentinel("0"));

    EXPECT_DOUBLE_EQ(FieldCoercion::to_double("N/A", -1.0), -1.0);
    EXPECT_EQ(FieldCoercion::to_count("", 5), 5);
}

TEST(FieldCoercionTest, ParsesNumericText) {
    EXPECT_DOUBLE_EQ(FieldCoercion::to_double(" 12.5 "), 12.5);
    EXPECT_DOUBLE_EQ(FieldCoercion::to_double("abc", 3.0), 3.0);
    EXPECT_DOUBLE_EQ(FieldCoercion::to_double("12abc", 3.0), 3.0);
    EXPECT_DOUBLE_EQ(FieldCoercion::to_double("inf", 3.0), 3.0);

    EXPECT_EQ(FieldCoercion::to_count("12.0"), 12);
    EXPECT_EQ(FieldCoercion::to_count("12.9"), 12);
    EXPECT_EQ(FieldCoercion::to_count("-3.7"), -3);
    EXPECT_EQ(FieldCoercion::to_count("1e30", 9), 9);
}

TEST(FieldCoercionTest, JsonValues) {
    EXPECT_DOUBLE_EQ(FieldCoercion::json_double(nlohmann::json(4.25)), 4.25);
    EXPECT_DOUBLE_EQ(FieldCoercion::json_double(nlohmann::json("7.5")), 7.5);
    EXPECT_DOUBLE_EQ(FieldCoercion::json_double(nlohmann::json(nullptr), 1.0), 1.0);
    EXPECT_DOUBLE_EQ(FieldCoercion::json_double(nlohmann::json::array(), 2.0), 2.0);

    EXPECT_EQ(FieldCoercion::json_count(nlohmann::json(1500)), 1500);
    EXPECT_EQ(FieldCoercion::json_count(nlohmann::json(1500.8)), 1500);
    EXPECT_EQ(FieldCoercion::json_count(nlohmann::json("N/A"), -1), -1);

    EXPECT_EQ(FieldCoercion::json_string(nlohmann::json("CALL")), "CALL");
    EXPECT_EQ(FieldCoercion::json_string(nlohmann::json(nullptr), "none"), "none");
    EXPECT_EQ(FieldCoercion::json_string(nlohmann::json(3)), "3");
}

TEST(FieldCoercionTest, ArrowCells) {
    auto doubles = double_array({1.5, std::numeric_limits<double>::quiet_NaN()});
    auto counts = int64_array({250});
    auto text = string_array({"88.8", "N/A"});

    EXPECT_DOUBLE_EQ(FieldCoercion::cell_double(doubles, 0), 1.5);
    EXPECT_DOUBLE_EQ(FieldCoercion::cell_double(doubles, 1, -1.0), -1.0);
    EXPECT_DOUBLE_EQ(FieldCoercion::cell_double(counts, 0), 250.0);
    EXPECT_DOUBLE_EQ(FieldCoercion::cell_double(text, 0), 88.8);
    EXPECT_DOUBLE_EQ(FieldCoercion::cell_double(text, 1, 0.5), 0.5);

    EXPECT_EQ(FieldCoercion::cell_count(doubles, 0), 1);
    EXPECT_EQ(FieldCoercion::cell_count(counts, 0), 250);
    EXPECT_EQ(FieldCoercion::cell_count(text, 0), 88);

    EXPECT_EQ(FieldCoercion::cell_string(text, 0), "88.8");
    EXPECT_EQ(FieldCoercion::cell_string(counts, 0), "250");
}

TEST(FieldCoercionTest, MissingCellsUseDefault) {
    std::shared_ptr<arrow::Array> none;
    EXPECT_DOUBLE_EQ(FieldCoercion::cell_double(none, 0, 2.0), 2.0);
    EXPECT_EQ(FieldCoercion::cell_count(int64_array({1}), 5, 7), 7);
    EXPECT_EQ(FieldCoercion::cell_string(string_array({"a"}), -1, "x"), "x");

    arrow::DoubleBuilder builder;
    check_status(builder.AppendNull());
    std::shared_ptr<arrow::Array> nulls;
    check_status(builder.Finish(&nulls));
    EXPECT_DOUBLE_EQ(FieldCoercion::cell_double(nulls, 0, 9.0), 9.0);
}
