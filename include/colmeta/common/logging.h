#pragma once

#include <string>

#include <spdlog/common.h>

#include <colmeta/config/service_config.h>
#include <colmeta/core/types.h>

namespace colmeta::logging {

// "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off";
// anything else falls back to info.
spdlog::level::level_enum parseLevel(const std::string& name);

// Install the default "colmeta" logger: stderr colour sink plus an optional
// rotating file sink when cfg.logFile is set.
Result<void> initLogging(const config::ServiceConfig& cfg);

} // namespace colmeta::logging
