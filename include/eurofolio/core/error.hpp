// include/eurofolio/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace eurofolio {

/**
 * @brief Error codes for the backtesting engine and its file layer
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,

    // Engine input errors
    VALIDATION_ERROR = 3,
    MISSING_DATA = 4,

    // Price data errors
    DATA_NOT_FOUND = 5,
    INVALID_DATA = 6,

    // File layer
    FILE_NOT_FOUND = 7,
    FILE_IO_ERROR = 8,
    JSON_PARSE_ERROR = 9
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::VALIDATION_ERROR:
            return "VALIDATION_ERROR";
        case ErrorCode::MISSING_DATA:
            return "MISSING_DATA";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
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
 * @brief Error carried by a failed Result, tagged with the reporting component
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    // "Error in <component>: <message> (<CODE>)"
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Value or error returned by every fallible eurofolio operation
 *
 * Move-only. T must be default constructible since a failed result still
 * holds an empty value.
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

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

    // Throws the stored EngineError on a failed result
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    // Moves the value out; the result is left holding a moved-from value
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    // nullptr on success
    const EngineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<EngineError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

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

    const EngineError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<EngineError> error_;
};

template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<EngineError>(code, message, component));
}

/**
 * @brief Re-wrap the error of a failed result as a result of another type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed) {
    const EngineError* err = failed.error();
    return make_error<T>(err->code(), err->what(), err->component());
}

}  // namespace eurofolio
