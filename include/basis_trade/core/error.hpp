// include/basis_trade/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace basis_trade {

/**
 * @brief Failure categories reported through Result
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,

    // Caller supplied a value the operation cannot work with
    // (bad threshold grid, empty expiry schedule, malformed contract code)
    INVALID_ARGUMENT = 2,

    // Market data
    DATA_NOT_FOUND = 4,
    INVALID_DATA = 5,
    MARKET_DATA_ERROR = 7,

    // Files and configuration
    FILE_NOT_FOUND = 8,
    FILE_IO_ERROR = 9,
    JSON_PARSE_ERROR = 10
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::MARKET_DATA_ERROR:
            return "MARKET_DATA_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Error raised by a basis trade component
 *
 * Normally travels inside a Result; only thrown when value() is called on
 * a failed Result.
 */
class BasisError : public std::runtime_error {
public:
    BasisError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief "[Component] CODE_NAME: message"
     */
    std::string to_string() const {
        std::string text;
        if (!component_.empty()) {
            text = "[" + component_ + "] ";
        }
        return text + error_code_name(code_) + ": " + what();
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Value or BasisError returned by every fallible operation
 *
 * Move-only. Construct implicitly from a value on success, or through
 * make_error() on failure.
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<BasisError> error) : error_(std::move(error)) {}

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
     * @throws BasisError if the result holds an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief nullptr on success
     */
    const BasisError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<BasisError> error_;
};

template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<BasisError> error) : error_(std::move(error)) {}

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

    const BasisError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<BasisError> error_;
};

template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<BasisError>(code, message, component));
}

/**
 * @brief Re-raise a failed Result as a Result<T> of the calling component
 * Code and message are kept. `failed` must hold an error.
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed, const std::string& component) {
    return make_error<T>(failed.error()->code(), failed.error()->what(), component);
}

}  // namespace basis_trade
