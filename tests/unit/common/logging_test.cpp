#include <gtest/gtest.h>

#include <filesystem>

#include <spdlog/spdlog.h>

#include <colmeta/common/logging.h>

#include "../../common/test_helpers.h"

using namespace colmeta;

TEST(LoggingParseLevel, KnownNamesCaseInsensitive) {
    EXPECT_EQ(logging::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(logging::parseLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(logging::parseLevel("info"), spdlog::level::info);
    EXPECT_EQ(logging::parseLevel("Warn"), spdlog::level::warn);
    EXPECT_EQ(logging::parseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(logging::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(logging::parseLevel("critical"), spdlog::level::critical);
    EXPECT_EQ(logging::parseLevel("off"), spdlog::level::off);
}

TEST(LoggingParseLevel, UnknownFallsBackToInfo) {
    EXPECT_EQ(logging::parseLevel(""), spdlog::level::info);
    EXPECT_EQ(logging::parseLevel("verbose"), spdlog::level::info);
}

TEST(LoggingInit, InstallsDefaultLoggerWithFileSink) {
    auto dir = colmeta::test::make_temp_dir("colmeta_logging_test_");
    config::ServiceConfig cfg;
    cfg.logLevel = "warn";
    cfg.logFile = dir / "logs" / "colmeta.log";

    auto result = logging::initLogging(cfg);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(spdlog::default_logger()->name(), "colmeta");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
    EXPECT_EQ(spdlog::default_logger()->sinks().size(), 2u);

    spdlog::warn("logging test line");
    spdlog::default_logger()->flush();
    EXPECT_TRUE(std::filesystem::exists(cfg.logFile));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(LoggingInit, RequestLoggingForcesDebug) {
    config::ServiceConfig cfg;
    cfg.logLevel = "error";
    cfg.logRequests = true;

    ASSERT_TRUE(logging::initLogging(cfg));
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
    EXPECT_EQ(spdlog::default_logger()->sinks().size(), 1u);

    spdlog::set_level(spdlog::level::info);
}
