#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace probelink {

enum class ErrorKind {
    TransportUnavailable,  // stack not initialized, adapter missing, permission denied
    TransportFailure,      // connect/read/write/subscribe rejected, link dropped
    TooShort,              // payload shorter than its fixed layout
    InvalidState,          // operation attempted in the wrong ConnectionState
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransportUnavailable: return "transport_unavailable";
        case ErrorKind::TransportFailure: return "transport_failure";
        case ErrorKind::TooShort: return "too_short";
        case ErrorKind::InvalidState: return "invalid_state";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::TransportFailure;
    std::string message;
};

// Outcome of an operation with no value
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status failure(ErrorKind kind, std::string message) {
        return Status(Error{kind, std::move(message)});
    }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    // Only valid when !ok()
    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

// Value or error
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    static Result failure(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(data_); }
    T& value() & { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    const T& operator*() const& { return value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<Error>(data_); }

    // Drop the value, keep the error
    Status status() const { return ok() ? Status{} : Status(error()); }

private:
    std::variant<T, Error> data_;
};

} // namespace probelink
