// SPDX-License-Identifier: Apache-2.0

#include <colmeta/config/service_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace colmeta::config {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(kWhitespace);
    return std::string(text.substr(first, last - first + 1));
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string unquote(std::string value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        return value.substr(1, value.size() - 2);
    return value;
}

// A '#' inside a double-quoted value is part of the value.
std::string_view stripComment(std::string_view line) {
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            quoted = !quoted;
        } else if (line[i] == '#' && !quoted) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::optional<std::size_t> parseCount(const std::string& text) {
    std::size_t value = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end)
        return std::nullopt;
    return value;
}

Result<void> applyWorkers(ServiceConfig& cfg, const std::string& raw, const char* source) {
    auto workers = parseCount(trim(raw));
    if (!workers || *workers == 0) {
        return Error{ErrorCode::InvalidArgument,
                     std::string(source) + ": worker count must be a positive integer, got '" +
                         raw + "'"};
    }
    cfg.workerThreads = *workers;
    return {};
}

} // namespace

bool ConfigLoader::envTruthy(const char* value) {
    static constexpr std::array<std::string_view, 5> kFalseSpellings{"", "0", "false", "off",
                                                                     "no"};
    if (!value)
        return false;
    const auto normalized = lowercase(trim(value));
    return std::find(kFalseSpellings.begin(), kFalseSpellings.end(), normalized) ==
           kFalseSpellings.end();
}

std::filesystem::path ConfigLoader::resolveDefaultConfigPath() {
    std::vector<std::filesystem::path> candidates;
    if (const char* explicitPath = std::getenv("COLMETA_CONFIG_PATH");
        explicitPath && *explicitPath)
        candidates.emplace_back(explicitPath);
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        candidates.push_back(std::filesystem::path(xdg) / "colmeta" / "config.toml");
    if (const char* home = std::getenv("HOME"); home && *home)
        candidates.push_back(std::filesystem::path(home) / ".config" / "colmeta" / "config.toml");

    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (std::filesystem::is_regular_file(candidate, ec))
            return candidate;
    }
    return {};
}

std::map<std::string, std::string>
ConfigLoader::parseSimpleTomlFlat(const std::filesystem::path& path) {
    std::map<std::string, std::string> values;
    std::ifstream file(path);
    if (!file) {
        spdlog::warn("Cannot open config file {}", path.string());
        return values;
    }

    std::string section;
    std::string raw;
    while (std::getline(file, raw)) {
        const auto line = trim(stripComment(raw));
        if (line.empty())
            continue;
        const std::string_view view(line);

        if (view.front() == '[') {
            if (view.back() == ']')
                section = trim(view.substr(1, view.size() - 2));
            continue;
        }

        const auto eq = view.find('=');
        if (eq == std::string_view::npos)
            continue;
        auto key = trim(view.substr(0, eq));
        if (key.empty())
            continue;
        values[section.empty() ? key : section + "." + key] = unquote(trim(view.substr(eq + 1)));
    }
    return values;
}

Result<ServiceConfig> ConfigLoader::fromFlatMap(const std::map<std::string, std::string>& values) {
    ServiceConfig cfg;

    if (auto it = values.find("service.worker_threads"); it != values.end()) {
        if (auto r = applyWorkers(cfg, it->second, "service.worker_threads"); !r)
            return r.error();
    }
    if (auto it = values.find("service.log_requests"); it != values.end()) {
        cfg.logRequests = envTruthy(it->second.c_str());
    }
    if (auto it = values.find("logging.level"); it != values.end()) {
        cfg.logLevel = it->second;
    }
    if (auto it = values.find("logging.file"); it != values.end()) {
        cfg.logFile = it->second;
    }

    if (const char* workers = std::getenv("COLMETA_WORKERS"); workers && *workers) {
        if (auto r = applyWorkers(cfg, workers, "COLMETA_WORKERS"); !r)
            return r.error();
    }
    if (const char* level = std::getenv("COLMETA_LOG_LEVEL"); level && *level) {
        cfg.logLevel = level;
    }
    if (const char* logFile = std::getenv("COLMETA_LOG_FILE"); logFile && *logFile) {
        cfg.logFile = logFile;
    }
    return cfg;
}

Result<ServiceConfig> ConfigLoader::load(const std::filesystem::path& path) {
    std::map<std::string, std::string> values;
    if (!path.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            values = parseSimpleTomlFlat(path);
            spdlog::debug("Loaded {} config keys from {}", values.size(), path.string());
        } else {
            spdlog::info("Config file {} not found, using defaults", path.string());
        }
    }
    return fromFlatMap(values);
}

} // namespace colmeta::config
