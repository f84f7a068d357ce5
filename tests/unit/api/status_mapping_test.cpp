#include <gtest/gtest.h>

#include <colmeta/api/status.h>

#include <string>
#include <utility>
#include <vector>

using namespace colmeta;
using namespace colmeta::api;

namespace {

struct MappingCase {
    ErrorCode error;
    StatusCode status;
};

class ErrorToStatusTest : public ::testing::TestWithParam<MappingCase> {};

} // namespace

TEST_P(ErrorToStatusTest, MapsCodeAndKeepsMessage) {
    const auto& param = GetParam();
    const std::string message = std::string("coordinator said: ") + errorToString(param.error);

    auto status = errorToStatus(Error{param.error, message});

    EXPECT_EQ(status.code, param.status) << errorToString(param.error);
    EXPECT_EQ(status.message, message);
}

INSTANTIATE_TEST_SUITE_P(
    AllErrorCodes, ErrorToStatusTest,
    ::testing::Values(MappingCase{ErrorCode::InvalidArgument, StatusCode::InvalidArgument},
                      MappingCase{ErrorCode::BadRequest, StatusCode::InvalidArgument},
                      MappingCase{ErrorCode::ValidationError, StatusCode::InvalidArgument},
                      MappingCase{ErrorCode::NotFound, StatusCode::NotFound},
                      MappingCase{ErrorCode::AlreadyExists, StatusCode::AlreadyExists},
                      MappingCase{ErrorCode::Timeout, StatusCode::DeadlineExceeded},
                      MappingCase{ErrorCode::Unavailable, StatusCode::Unavailable},
                      MappingCase{ErrorCode::Locked, StatusCode::FailedPrecondition},
                      MappingCase{ErrorCode::PreconditionFailed, StatusCode::FailedPrecondition},
                      MappingCase{ErrorCode::PermissionDenied, StatusCode::PermissionDenied},
                      MappingCase{ErrorCode::ResourceExhausted, StatusCode::ResourceExhausted},
                      MappingCase{ErrorCode::ChecksumMismatch, StatusCode::DataLoss},
                      MappingCase{ErrorCode::OperationCancelled, StatusCode::Cancelled},
                      MappingCase{ErrorCode::InternalError, StatusCode::Internal},
                      MappingCase{ErrorCode::Unknown, StatusCode::Internal},
                      MappingCase{ErrorCode::Success, StatusCode::Internal}));

TEST(ErrorToStatus, EmptyMessageFallsBackToCodeDescription) {
    auto status = errorToStatus(Error{ErrorCode::NotFound, ""});
    EXPECT_EQ(status.code, StatusCode::NotFound);
    EXPECT_EQ(status.message, "Not found");
}

TEST(ErrorToStatus, MappingIsDeterministic) {
    Error err{ErrorCode::Locked, "write lock held"};
    auto a = errorToStatus(err);
    auto b = errorToStatus(err);
    EXPECT_EQ(a.code, b.code);
    EXPECT_EQ(a.message, b.message);
}

TEST(StatusCodeName, UsesTransportSpelling) {
    EXPECT_STREQ(statusCodeName(StatusCode::Ok), "OK");
    EXPECT_STREQ(statusCodeName(StatusCode::InvalidArgument), "INVALID_ARGUMENT");
    EXPECT_STREQ(statusCodeName(StatusCode::DeadlineExceeded), "DEADLINE_EXCEEDED");
    EXPECT_STREQ(statusCodeName(StatusCode::FailedPrecondition), "FAILED_PRECONDITION");
    EXPECT_STREQ(statusCodeName(StatusCode::DataLoss), "DATA_LOSS");
}

TEST(Status, FactoriesSetCode) {
    EXPECT_TRUE(Status{}.ok());
    EXPECT_EQ(Status::invalidArgument("x").code, StatusCode::InvalidArgument);
    EXPECT_EQ(Status::internal("y").code, StatusCode::Internal);
    EXPECT_FALSE(Status::internal("y").ok());
}
