// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

#include <colmeta/core/types.h>

namespace colmeta::config {

struct ServiceConfig {
    std::size_t workerThreads{4};
    std::string logLevel{"info"};
    std::filesystem::path logFile; // empty: console only
    // Lowers the whole "colmeta" logger to at least debug, which makes the
    // dispatcher's per-call lines visible.
    bool logRequests{false};
};

/**
 * @brief Static helpers that resolve and parse the service configuration.
 *
 * ## Precedence
 * defaults < config file (`[service]`, `[logging]`) < environment
 * (`COLMETA_WORKERS`, `COLMETA_LOG_LEVEL`, `COLMETA_LOG_FILE`).
 */
class ConfigLoader {
public:
    ConfigLoader() = delete;

    /**
     * @brief Returns true for any value except: empty, "0", "false", "off", "no"
     * (case-insensitive, surrounding whitespace ignored).
     */
    static bool envTruthy(const char* value);

    /**
     * @brief Resolve the default config file path.
     *
     * Search order:
     * 1. COLMETA_CONFIG_PATH environment variable
     * 2. $XDG_CONFIG_HOME/colmeta/config.toml
     * 3. $HOME/.config/colmeta/config.toml
     *
     * @return Path to config file if found, empty path otherwise
     */
    static std::filesystem::path resolveDefaultConfigPath();

    /**
     * @brief Parse a simple TOML file into a flat key-value map.
     *
     * Supports `[section]` headers (flattened as "section.key"), `key = value`
     * assignments with optional double quotes, and `#` comments. A `#` inside a
     * quoted value is kept. Lines without `=` or with an empty key are skipped.
     */
    static std::map<std::string, std::string>
    parseSimpleTomlFlat(const std::filesystem::path& path);

    // Build a config from a flattened key map, then apply environment overrides.
    static Result<ServiceConfig> fromFlatMap(const std::map<std::string, std::string>& values);

    // Load from `path`; an empty or missing path yields defaults plus env overrides.
    static Result<ServiceConfig> load(const std::filesystem::path& path);
};

} // namespace colmeta::config
