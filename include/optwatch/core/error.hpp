// include/optwatch/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace optwatch {

/**
 * @brief Error codes for the option monitor
 * Defines all error conditions that can cross a component boundary
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATABASE_ERROR = 4,
    DATA_NOT_FOUND = 5,
    INVALID_DATA = 6,
    CONVERSION_ERROR = 7,

    // Market data API errors
    CONNECTION_ERROR = 8,
    TIMEOUT_ERROR = 9,
    API_ERROR = 10,
    EMPTY_RESULT = 11,
    RETRIES_EXHAUSTED = 12,

    // Scheduling errors
    TURN_TIMEOUT = 13,

    // Notification errors
    NOTIFICATION_ERROR = 14,

    // Configuration and I/O errors
    CONFIG_ERROR = 15,
    FILE_NOT_FOUND = 16,
    FILE_IO_ERROR = 17,
    JSON_PARSE_ERROR = 18,

    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::API_ERROR:
            return "API_ERROR";
        case ErrorCode::EMPTY_RESULT:
            return "EMPTY_RESULT";
        case ErrorCode::RETRIES_EXHAUSTED:
            return "RETRIES_EXHAUSTED";
        case ErrorCode::TURN_TIMEOUT:
            return "TURN_TIMEOUT";
        case ErrorCode::NOTIFICATION_ERROR:
            return "NOTIFICATION_ERROR";
        case ErrorCode::CONFIG_ERROR:
            return "CONFIG_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Exception type carried inside a failed Result
 */
class MonitorError : public std::runtime_error {
public:
    /**
     * @brief Constructor for MonitorError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    MonitorError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<MonitorError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @throws MonitorError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws MonitorError if result represents an error
     */
    T take() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    const MonitorError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<MonitorError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<MonitorError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const MonitorError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<MonitorError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<MonitorError>(code, message, component));
}

}  // namespace optwatch
