#pragma once

#include <string>
#include <variant>
#include <utility>

namespace ek::core {

enum class ErrorCode {
    Validation,
    UnknownAction,
    HostOperation,
    NotFound,
    UndoUnavailable,
    InvalidState
};

const char* to_string(ErrorCode code) noexcept;

struct Error {
    ErrorCode code = ErrorCode::InvalidState;
    std::string message;
};

/**
 * Result type for operations that can fail
 * Provides a safe way to handle success/error cases without exceptions
 */
template<typename T>
class Result {
public:
    // Constructors
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(Error error) : data_(std::move(error)) {}

    // Check if result is successful
    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return is_ok(); }

    // Access value (only call if is_ok())
    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    // Access error (only call if is_error())
    const Error& error() const { return std::get<Error>(data_); }
    ErrorCode code() const { return error().code; }
    const std::string& message() const { return error().message; }

private:
    std::variant<T, Error> data_;
};

// Helper functions for creating Results
template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
Result<T> Fail(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

// Void result type for operations that don't return values
using VoidResult = Result<bool>;

inline VoidResult Ok() {
    return VoidResult(true);
}

inline VoidResult Fail(ErrorCode code, std::string message) {
    return VoidResult(Error{code, std::move(message)});
}

} // namespace ek::core
