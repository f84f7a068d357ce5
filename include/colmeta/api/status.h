#pragma once

#include <string>
#include <utility>

#include <colmeta/core/types.h>

namespace colmeta::api {

// Transport-level status codes surfaced to callers of the collections service.
enum class StatusCode {
    Ok = 0,
    Cancelled,
    Unknown,
    InvalidArgument,
    DeadlineExceeded,
    NotFound,
    AlreadyExists,
    PermissionDenied,
    ResourceExhausted,
    FailedPrecondition,
    Aborted,
    Internal,
    Unavailable,
    DataLoss
};

const char* statusCodeName(StatusCode code) noexcept;

struct Status {
    StatusCode code{StatusCode::Ok};
    std::string message;

    static Status invalidArgument(std::string msg) {
        return Status{StatusCode::InvalidArgument, std::move(msg)};
    }
    static Status internal(std::string msg) { return Status{StatusCode::Internal, std::move(msg)}; }

    bool ok() const noexcept { return code == StatusCode::Ok; }
};

// Result type returned across the service boundary
template <typename T> using ServiceResult = Result<T, Status>;

/**
 * @brief Map a coordinator error into a transport status.
 *
 * The table is fixed; the coordinator's message is carried over verbatim.
 * Codes without a dedicated entry collapse to StatusCode::Internal.
 */
Status errorToStatus(const Error& error);

} // namespace colmeta::api
