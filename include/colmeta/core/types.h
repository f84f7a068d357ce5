#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <spdlog/fmt/fmt.h>

namespace colmeta {

// Type aliases
using TimePoint = std::chrono::steady_clock::time_point;
using WaitTimeout = std::chrono::seconds;

// Error types reported by the coordinator
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    BadRequest,
    ValidationError,
    NotFound,
    AlreadyExists,
    Timeout,
    Unavailable,
    Locked,
    PreconditionFailed,
    PermissionDenied,
    ResourceExhausted,
    ChecksumMismatch,
    OperationCancelled,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::BadRequest: return "Bad request";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Unavailable: return "Service unavailable";
        case ErrorCode::Locked: return "Locked";
        case ErrorCode::PreconditionFailed: return "Precondition failed";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

} // namespace colmeta

// fmt support for ErrorCode (for spdlog)
template <> struct fmt::formatter<colmeta::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(colmeta::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", colmeta::errorToString(error));
    }
};

namespace colmeta {

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Value-or-error result. E defaults to the coordinator Error; the api layer
// instantiates it with its transport Status.
template <typename T, typename E = Error> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(E error) : data_(std::move(error)) {}

    template <typename U = E>
    requires std::is_same_v<U, Error>
    Result(ErrorCode error) : data_(Error{error}) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const E& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<E>(data_);
    }

private:
    std::variant<T, E> data_;
};

// Specialization for void
template <typename E> class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)), failed_(true) {}

    template <typename U = E>
    requires std::is_same_v<U, Error>
    Result(ErrorCode error) : error_(Error{error}), failed_(true) {}

    bool has_value() const noexcept { return !failed_; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const E& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    E error_{};
    bool failed_{false};
};

} // namespace colmeta
