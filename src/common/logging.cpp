#include <colmeta/common/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <vector>

namespace colmeta::logging {

spdlog::level::level_enum parseLevel(const std::string& name) {
    std::string level(name);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

Result<void> initLogging(const config::ServiceConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!cfg.logFile.empty()) {
        try {
            if (cfg.logFile.has_parent_path()) {
                std::filesystem::create_directories(cfg.logFile.parent_path());
            }
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.logFile.string(), max_size, max_files));
        } catch (const std::exception& e) {
            return Error{ErrorCode::InternalError,
                         "Failed to open log file " + cfg.logFile.string() + ": " + e.what()};
        }
    }

    auto logger = std::make_shared<spdlog::logger>("colmeta", sinks.begin(), sinks.end());
    auto level = parseLevel(cfg.logLevel);
    if (cfg.logRequests && level > spdlog::level::debug) {
        level = spdlog::level::debug;
    }
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::info("Logging initialised (level={}, file={})", spdlog::level::to_string_view(level),
                 cfg.logFile.empty() ? std::string("none") : cfg.logFile.string());
    return {};
}

} // namespace colmeta::logging
