#pragma once
#include <string>
#include <optional>
#include <utility>
#include <variant>

namespace context_engine {

enum class ErrorCode {
    IndexingFailure,
    EmbeddingUnavailable,
    StorageUnavailable,
    NetworkDegraded,
    InvalidArgument,
    Io
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::IndexingFailure:      return "IndexingFailure";
        case ErrorCode::EmbeddingUnavailable: return "EmbeddingUnavailable";
        case ErrorCode::StorageUnavailable:   return "StorageUnavailable";
        case ErrorCode::NetworkDegraded:      return "NetworkDegraded";
        case ErrorCode::InvalidArgument:      return "InvalidArgument";
        case ErrorCode::Io:                   return "Io";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code;
    std::string message;

    std::string describe() const {
        return std::string(error_code_name(code)) + ": " + message;
    }
};

// Outcome of an operation with no payload.
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status success() { return Status(); }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<Error>(data_); }

    T value_or(T fallback) const {
        return ok() ? std::get<T>(data_) : std::move(fallback);
    }

private:
    std::variant<T, Error> data_;
};

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

} // namespace context_engine
