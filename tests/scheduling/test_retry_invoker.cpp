#include <gtest/gtest.h>
#include <stdexcept>
#include "../core/test_base.hpp"
#include "../mocks/arrow_tables.hpp"
#include "optwatch/scheduling/retry_invoker.hpp"

using namespace optwatch;
using namespace optwatch::testing;

class RetryInvokerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        policy.max_retries = 3;
        policy.delay = std::chrono::milliseconds(0);
    }

    RetryPolicy policy;
};

TEST_F(RetryInvokerTest, FirstSuccessIsReturned) {
    int calls = 0;
    auto result = invoke_with_retry(
        [&]() -> Result<int> {
            ++calls;
            return Result<int>(42);
        },
        policy, "lookup");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryInvokerTest, SucceedsOnLaterAttempt) {
    int calls = 0;
    auto result = invoke_with_retry(
        [&]() -> Result<int> {
            if (++calls < 3) {
                return make_error<int>(ErrorCode::CONNECTION_ERROR, "refused");
            }
            return Result<int>(7);
        },
        policy, "lookup");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(calls, 3);
}

TEST_F(RetryInvokerTest, ExhaustedAttemptsCarryLastCause) {
    int calls = 0;
    auto result = invoke_with_retry(
        [&]() -> Result<int> {
            ++calls;
            return make_error<int>(ErrorCode::API_ERROR, "quota exceeded");
        },
        policy, "option chain");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(result.error()->code(), ErrorCode::RETRIES_EXHAUSTED);
    EXPECT_NE(std::string(result.error()->what()).find("quota exceeded"), std::string::npos);
    EXPECT_NE(std::string(result.error()->what()).find("option chain"), std::string::npos);
}

TEST_F(RetryInvokerTest, EmptyTableCountsAsFailure) {
    int calls = 0;
    auto result = invoke_with_retry(
        [&]() -> Result<std::shared_ptr<arrow::Table>> {
            ++calls;
            if (calls == 1) {
                return Result<std::shared_ptr<arrow::Table>>(std::shared_ptr<arrow::Table>());
            }
            if (calls == 2) {
                return Result<std::shared_ptr<arrow::Table>>(empty_table());
            }
            return Result<std::shared_ptr<arrow::Table>>(
                make_table({{"code", string_array({"HK.00700"})}}));
        },
        policy, "snapshot");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()->num_rows(), 1);
    EXPECT_EQ(calls, 3);
}

TEST_F(RetryInvokerTest, EmptyVectorCountsAsFailure) {
    auto result = invoke_with_retry(
        []() -> Result<std::vector<std::string>> {
            return Result<std::vector<std::string>>(std::vector<std::string>{});
        },
        policy, "expiries");

    ASSERT_TRUE(result.is_error());
    EXPECT_NE(std::string(result.error()->what()).find("EMPTY_RESULT"), std::string::npos);
}

TEST_F(RetryInvokerTest, ExceptionsAreRetried) {
    int calls = 0;
    auto result = invoke_with_retry(
        [&]() -> Result<int> {
            if (++calls == 1) {
                throw std::runtime_error("socket closed");
            }
            return Result<int>(1);
        },
        policy, "lookup");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(calls, 2);
}

TEST_F(RetryInvokerTest, NonPositiveBoundStillMakesOneAttempt) {
    policy.max_retries = 0;
    int calls = 0;
    auto result = invoke_with_retry(
        [&]() -> Result<int> {
            ++calls;
            throw std::runtime_error("boom");
        },
        policy, "lookup");

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(calls, 1);
}
