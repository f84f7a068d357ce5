#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <string>

#include <colmeta/config/service_config.h>

#include "../../common/test_helpers.h"

using namespace colmeta;
using namespace colmeta::config;
using colmeta::test::ScopedEnvVar;

namespace fs = std::filesystem;

class ServiceConfigTest : public ::testing::Test {
protected:
    void SetUp() override { tempDir_ = colmeta::test::make_temp_dir("colmeta_config_test_"); }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir_, ec);
    }

    // Keep the developer's environment out of the loader.
    ScopedEnvVar workers_{"COLMETA_WORKERS", std::nullopt};
    ScopedEnvVar level_{"COLMETA_LOG_LEVEL", std::nullopt};
    ScopedEnvVar logFile_{"COLMETA_LOG_FILE", std::nullopt};
    ScopedEnvVar configPath_{"COLMETA_CONFIG_PATH", std::nullopt};
    fs::path tempDir_;
};

TEST_F(ServiceConfigTest, DefaultsWhenNothingConfigured) {
    auto cfg = ConfigLoader::fromFlatMap({});
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().workerThreads, 4u);
    EXPECT_EQ(cfg.value().logLevel, "info");
    EXPECT_TRUE(cfg.value().logFile.empty());
    EXPECT_FALSE(cfg.value().logRequests);
}

TEST_F(ServiceConfigTest, ParsesSectionsAndComments) {
    auto path = colmeta::test::write_file(tempDir_ / "config.toml",
                                          "# colmeta\n"
                                          "[service]\n"
                                          "worker_threads = 8   # threads\n"
                                          "log_requests = true\n"
                                          "\n"
                                          "[logging]\n"
                                          "level = \"debug\"\n"
                                          "file = \"/var/log/colmeta/service.log\"\n");

    auto flat = ConfigLoader::parseSimpleTomlFlat(path);
    EXPECT_EQ(flat["service.worker_threads"], "8");
    EXPECT_EQ(flat["logging.level"], "debug");

    auto cfg = ConfigLoader::load(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().workerThreads, 8u);
    EXPECT_TRUE(cfg.value().logRequests);
    EXPECT_EQ(cfg.value().logLevel, "debug");
    EXPECT_EQ(cfg.value().logFile, fs::path("/var/log/colmeta/service.log"));
}

TEST_F(ServiceConfigTest, HashInsideQuotedValueIsKept) {
    auto path = colmeta::test::write_file(tempDir_ / "config.toml",
                                          "top = level\n"
                                          "[logging]\n"
                                          "file = \"/tmp/run#1/colmeta.log\" # trailing\n"
                                          "no equals sign here\n"
                                          " = orphan\n");

    auto flat = ConfigLoader::parseSimpleTomlFlat(path);
    EXPECT_EQ(flat["top"], "level");
    EXPECT_EQ(flat["logging.file"], "/tmp/run#1/colmeta.log");
    EXPECT_EQ(flat.size(), 2u);
}

TEST_F(ServiceConfigTest, EnvironmentOverridesFile) {
    auto path = colmeta::test::write_file(tempDir_ / "config.toml",
                                          "[service]\nworker_threads = 2\n"
                                          "[logging]\nlevel = \"warn\"\n");
    ScopedEnvVar workers{"COLMETA_WORKERS", std::string("6")};
    ScopedEnvVar level{"COLMETA_LOG_LEVEL", std::string("trace")};

    auto cfg = ConfigLoader::load(path);
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().workerThreads, 6u);
    EXPECT_EQ(cfg.value().logLevel, "trace");
}

TEST_F(ServiceConfigTest, RejectsBadWorkerCount) {
    auto zero = ConfigLoader::fromFlatMap({{"service.worker_threads", "0"}});
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(zero.error().message.find("service.worker_threads"), std::string::npos);

    auto garbage = ConfigLoader::fromFlatMap({{"service.worker_threads", "many"}});
    ASSERT_FALSE(garbage);

    ScopedEnvVar workers{"COLMETA_WORKERS", std::string("-3")};
    auto fromEnv = ConfigLoader::fromFlatMap({});
    ASSERT_FALSE(fromEnv);
    EXPECT_NE(fromEnv.error().message.find("COLMETA_WORKERS"), std::string::npos);
}

TEST_F(ServiceConfigTest, MissingFileFallsBackToDefaults) {
    auto cfg = ConfigLoader::load(tempDir_ / "absent.toml");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().workerThreads, 4u);
}

TEST_F(ServiceConfigTest, ExplicitConfigPathWins) {
    auto path = colmeta::test::write_file(tempDir_ / "custom.toml", "[service]\n");
    ScopedEnvVar explicitPath{"COLMETA_CONFIG_PATH", path.string()};
    EXPECT_EQ(ConfigLoader::resolveDefaultConfigPath(), path);
}

TEST_F(ServiceConfigTest, XdgConfigHomeIsSearched) {
    auto path = colmeta::test::write_file(tempDir_ / "colmeta" / "config.toml", "");
    ScopedEnvVar xdg{"XDG_CONFIG_HOME", tempDir_.string()};
    EXPECT_EQ(ConfigLoader::resolveDefaultConfigPath(), path);
}

TEST(ConfigLoaderEnvTruthy, RecognisesFalseSpellings) {
    EXPECT_FALSE(ConfigLoader::envTruthy(nullptr));
    EXPECT_FALSE(ConfigLoader::envTruthy(""));
    EXPECT_FALSE(ConfigLoader::envTruthy("0"));
    EXPECT_FALSE(ConfigLoader::envTruthy("False"));
    EXPECT_FALSE(ConfigLoader::envTruthy("OFF"));
    EXPECT_FALSE(ConfigLoader::envTruthy("no"));
    EXPECT_TRUE(ConfigLoader::envTruthy("1"));
    EXPECT_TRUE(ConfigLoader::envTruthy("yes"));
    EXPECT_FALSE(ConfigLoader::envTruthy("  off "));
    EXPECT_FALSE(ConfigLoader::envTruthy("   "));
    EXPECT_TRUE(ConfigLoader::envTruthy(" on "));
}
