#include <colmeta/api/status.h>

namespace colmeta::api {

const char* statusCodeName(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok:
            return "OK";
        case StatusCode::Cancelled:
            return "CANCELLED";
        case StatusCode::Unknown:
            return "UNKNOWN";
        case StatusCode::InvalidArgument:
            return "INVALID_ARGUMENT";
        case StatusCode::DeadlineExceeded:
            return "DEADLINE_EXCEEDED";
        case StatusCode::NotFound:
            return "NOT_FOUND";
        case StatusCode::AlreadyExists:
            return "ALREADY_EXISTS";
        case StatusCode::PermissionDenied:
            return "PERMISSION_DENIED";
        case StatusCode::ResourceExhausted:
            return "RESOURCE_EXHAUSTED";
        case StatusCode::FailedPrecondition:
            return "FAILED_PRECONDITION";
        case StatusCode::Aborted:
            return "ABORTED";
        case StatusCode::Internal:
            return "INTERNAL";
        case StatusCode::Unavailable:
            return "UNAVAILABLE";
        case StatusCode::DataLoss:
            return "DATA_LOSS";
    }
    return "UNKNOWN";
}

Status errorToStatus(const Error& error) {
    StatusCode code = StatusCode::Internal;
    switch (error.code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::BadRequest:
        case ErrorCode::ValidationError:
            code = StatusCode::InvalidArgument;
            break;
        case ErrorCode::NotFound:
            code = StatusCode::NotFound;
            break;
        case ErrorCode::AlreadyExists:
            code = StatusCode::AlreadyExists;
            break;
        case ErrorCode::Timeout:
            code = StatusCode::DeadlineExceeded;
            break;
        case ErrorCode::Unavailable:
            code = StatusCode::Unavailable;
            break;
        case ErrorCode::Locked:
        case ErrorCode::PreconditionFailed:
            code = StatusCode::FailedPrecondition;
            break;
        case ErrorCode::PermissionDenied:
            code = StatusCode::PermissionDenied;
            break;
        case ErrorCode::ResourceExhausted:
            code = StatusCode::ResourceExhausted;
            break;
        case ErrorCode::ChecksumMismatch:
            code = StatusCode::DataLoss;
            break;
        case ErrorCode::OperationCancelled:
            code = StatusCode::Cancelled;
            break;
        case ErrorCode::Success:
        case ErrorCode::InternalError:
        case ErrorCode::Unknown:
            code = StatusCode::Internal;
            break;
    }
    return Status{code, error.message.empty() ? errorToString(error.code) : error.message};
}

} // namespace colmeta::api
