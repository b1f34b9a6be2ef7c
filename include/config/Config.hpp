#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace tr::config {

constexpr static uint32_t MAX_REQUEST_SIZE_BYTES = 1024 * 1024; // 1MB

struct ServerConfig {
    std::string socket_path = "/run/testrunner/tools.sock";
    uint32_t max_request_bytes = MAX_REQUEST_SIZE_BYTES;
};

struct RspecConfig {
    std::vector<std::string> command = {
        "docker", "compose", "-f", "docker-compose.yml", "exec", "-T", "test", "bundle", "exec", "rspec"
    };
    // Appended after the command for run_rspec only; run_rspec_args passes the caller's flags instead
    std::vector<std::string> default_args = {"--format", "p"};
};

struct CypressConfig {
    std::vector<std::string> command = {"npx", "cypress", "run", "--reporter", "json", "--quiet", "--spec"};
    std::string working_dir = ".";
    // When set, runs `/bin/sh -c '<pipeline> "$1"'` instead of the argv command
    std::string shell_pipeline;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum testrunner = spdlog::level::info;  // Startup, shutdown, config
    spdlog::level::level_enum validation = spdlog::level::info;  // Rejected paths and arguments
    spdlog::level::level_enum process    = spdlog::level::info;  // Spawns and exit statuses
    spdlog::level::level_enum cypress    = spdlog::level::warn;  // Degraded output pipeline stages
    spdlog::level::level_enum tools      = spdlog::level::info;  // Tool dispatch and socket traffic
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/testrunner";
    LogLevelsConfig levels;
};

struct Config {
    ServerConfig server;
    RspecConfig rspec;
    CypressConfig cypress;
    LoggingConfig logging;

    [[nodiscard]] std::string dump() const;
};

Config loadConfig(const std::string& path);
Config parseConfig(const std::string& yaml);

// Command templates may be written as a YAML sequence or as one whitespace-separated string
std::vector<std::string> splitCommand(const std::string& command);

} // namespace tr::config
