/**
 * @file result.hpp
 * @brief Result type for error handling
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Core components report failures as Result<T> values instead of throwing.
 * Codes are grouped by hundreds: general, storage, configuration, network.
 */
#ifndef MAILBEACON_RESULT_HPP
#define MAILBEACON_RESULT_HPP

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mailbeacon {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    TIMEOUT = 2,
    NOT_SUPPORTED = 3,

    IO_ERROR = 200,

    CONFIG_INVALID = 400,
    CONFIG_MISSING = 401,
    CONFIG_PARSE_ERROR = 402,

    NETWORK_ERROR = 500,
    PROTOCOL_ERROR = 501
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::NOT_SUPPORTED: return "NOT_SUPPORTED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorCode::CONFIG_MISSING: return "CONFIG_MISSING";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
        case ErrorCode::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @struct Error
 * @brief Failure code, human-readable message and where it happened
 */
struct Error {
    ErrorCode code = ErrorCode::INVALID_ARGUMENT;
    std::string message;
    std::string context;   ///< e.g. the log path an append failed on

    Error() = default;
    Error(ErrorCode c, std::string msg = "") : code(c), message(std::move(msg)) {}

    /// "[CODE] message (context: ...)"
    [[nodiscard]] std::string toString() const {
        std::string out = "[";
        out += errorCodeToString(code);
        out += "]";
        if (!message.empty()) out += " " + message;
        if (!context.empty()) out += " (context: " + context + ")";
        return out;
    }

    [[nodiscard]] bool is(ErrorCode c) const { return code == c; }
};

/**
 * @class Result
 * @brief Either a value or an Error
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}
    Result(ErrorCode code, const std::string& msg = "") : data_(Error{code, msg}) {}

    [[nodiscard]] bool isOk() const { return data_.index() == 0; }
    [[nodiscard]] bool isError() const { return !isOk(); }
    [[nodiscard]] explicit operator bool() const { return isOk(); }

    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T& operator*() & { return value(); }

    [[nodiscard]] const Error& error() const { return std::get<1>(data_); }
    [[nodiscard]] ErrorCode errorCode() const { return isOk() ? ErrorCode::SUCCESS : error().code; }

    /// Copy with the error context set; a value passes through unchanged
    [[nodiscard]] Result withContext(const std::string& ctx) const {
        if (isOk()) return *this;
        Error err = error();
        err.context = ctx;
        return Result(std::move(err));
    }

private:
    std::variant<T, Error> data_;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string& msg = "") : error_(Error{code, msg}) {}

    [[nodiscard]] bool isOk() const { return !error_; }
    [[nodiscard]] bool isError() const { return error_.has_value(); }
    [[nodiscard]] explicit operator bool() const { return isOk(); }

    [[nodiscard]] const Error& error() const { return *error_; }
    [[nodiscard]] ErrorCode errorCode() const { return error_ ? error_->code : ErrorCode::SUCCESS; }

    [[nodiscard]] Result withContext(const std::string& ctx) const {
        if (isOk()) return *this;
        Error err = *error_;
        err.context = ctx;
        return Result(std::move(err));
    }

private:
    std::optional<Error> error_;
};

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) { return Result<std::decay_t<T>>(std::forward<T>(value)); }

inline Result<void> Err(ErrorCode code, const std::string& msg = "") { return Result<void>(code, msg); }

template<typename T>
Result<T> Err(ErrorCode code, const std::string& msg = "") { return Result<T>(code, msg); }

template<typename T>
Result<T> Err(const Error& err) { return Result<T>(err); }

} // namespace mailbeacon

#endif // MAILBEACON_RESULT_HPP
