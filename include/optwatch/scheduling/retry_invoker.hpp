// include/optwatch/scheduling/retry_invoker.hpp
#pragma once

#include <arrow/api.h>
#include <chrono>
#include <exception>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>
#include "optwatch/core/error.hpp"
#include "optwatch/core/logger.hpp"

namespace optwatch {

/**
 * @brief Bounded retry with a constant delay between attempts
 */
struct RetryPolicy {
    int max_retries{3};  // total attempts, at least one is always made
    std::chrono::milliseconds delay{std::chrono::seconds(10)};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["max_retries"] = max_retries;
        j["delay_ms"] = delay.count();
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("max_retries"))
            max_retries = j.at("max_retries").get<int>();
        if (j.contains("delay_ms"))
            delay = std::chrono::milliseconds(j.at("delay_ms").get<long long>());
    }
};

namespace detail {

inline bool is_empty_payload(const std::shared_ptr<arrow::Table>& table) {
    return !table || table->num_rows() == 0;
}

template <typename T>
bool is_empty_payload(const std::vector<T>& rows) {
    return rows.empty();
}

template <typename T>
bool is_empty_payload(const T&) {
    return false;
}

template <typename R>
std::string describe_failure(const R& result) {
    if (result.is_error()) {
        return error_code_to_string(result.error()->code()) + ": " + result.error()->what();
    }
    return "EMPTY_RESULT: operation returned no rows";
}

}  // namespace detail

/**
 * @brief Call an external operation until it yields a non-empty success
 *
 * An error result, a thrown exception and an empty payload (null or zero-row
 * table, empty vector) all count as failed attempts. Each failed attempt except
 * the last logs a warning and sleeps policy.delay; when every attempt fails an
 * error is logged and RETRIES_EXHAUSTED is returned carrying the last cause.
 *
 * @param func Callable returning Result<T>
 * @param policy Attempt bound and delay
 * @param what Human-readable name of the call for log lines
 */
template <typename Func>
auto invoke_with_retry(Func&& func, const RetryPolicy& policy, const std::string& what)
    -> decltype(func()) {
    using ReturnType = decltype(func());

    const int attempts = policy.max_retries < 1 ? 1 : policy.max_retries;
    std::string last_failure;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            auto result = func();
            if (result.is_ok() && !detail::is_empty_payload(result.value())) {
                if (attempt > 1) {
                    INFO(what << " succeeded on attempt " << attempt);
                }
                return result;
            }
            last_failure = detail::describe_failure(result);
        } catch (const std::exception& e) {
            last_failure = std::string("exception: ") + e.what();
        }

        if (attempt < attempts) {
            WARN(what << " failed (attempt " << attempt << " of " << attempts
                      << "), retrying in " << policy.delay.count() << "ms: " << last_failure);
            std::this_thread::sleep_for(policy.delay);
        }
    }

    ERROR(what << " failed after " << attempts << " attempts: " << last_failure);
    return ReturnType(std::make_unique<MonitorError>(
        ErrorCode::RETRIES_EXHAUSTED, what + " failed after " + std::to_string(attempts) +
                                          " attempts: " + last_failure,
        "RetryInvoker"));
}

}  // namespace optwatch
