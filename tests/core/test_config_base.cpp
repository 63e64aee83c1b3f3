// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "optwatch/core/config_base.hpp"
#include "optwatch/scheduling/retry_invoker.hpp"

using namespace optwatch;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "optwatch_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

class TestConfig : public ConfigBase {
public:
    std::string name = "default";
    int value = 42;
    double ratio = 0.5;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["value"] = value;
        j["ratio"] = ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j["name"].get<std::string>();
        if (j.contains("value"))
            value = j["value"].get<int>();
        if (j.contains("ratio"))
            ratio = j["ratio"].get<double>();
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TestConfig config;
    config.name = "test";
    config.value = 100;
    config.ratio = 1.5;

    std::filesystem::path file_path = test_dir / "test_config.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok()) << save_result.error()->what();
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TestConfig loaded_config;
    auto load_result = loaded_config.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok()) << load_result.error()->what();

    EXPECT_EQ(loaded_config.name, "test");
    EXPECT_EQ(loaded_config.value, 100);
    EXPECT_DOUBLE_EQ(loaded_config.ratio, 1.5);
}

TEST_F(ConfigBaseTest, DefaultValuesPreserved) {
    TestConfig config;
    nlohmann::json partial;
    partial["name"] = "partial";

    config.from_json(partial);

    EXPECT_EQ(config.name, "partial");
    EXPECT_EQ(config.value, 42);
    EXPECT_DOUBLE_EQ(config.ratio, 0.5);
}

TEST_F(ConfigBaseTest, MissingFileReported) {
    TestConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, InvalidJsonHandling) {
    TestConfig config;
    std::filesystem::path file_path = test_dir / "invalid.json";
    std::ofstream file(file_path);
    file << "{ this is not valid JSON }";
    file.close();

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, WrongValueTypeIsConfigError) {
    TestConfig config;
    std::filesystem::path file_path = test_dir / "wrong_type.json";
    std::ofstream file(file_path);
    file << R"({"value": "not a number"})";
    file.close();

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIG_ERROR);
}

TEST_F(ConfigBaseTest, RetryPolicySerialization) {
    RetryPolicy policy;
    policy.max_retries = 5;
    policy.delay = std::chrono::milliseconds(250);

    RetryPolicy copy;
    copy.from_json(policy.to_json());
    EXPECT_EQ(copy.max_retries, 5);
    EXPECT_EQ(copy.delay.count(), 250);

    RetryPolicy defaults;
    defaults.from_json(nlohmann::json::object());
    EXPECT_EQ(defaults.max_retries, 3);
    EXPECT_EQ(defaults.delay, std::chrono::seconds(10));
}
