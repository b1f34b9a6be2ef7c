#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace tr::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static std::vector<std::string> decodeCommand(const Node& node, const std::vector<std::string>& def) {
    if (!node) return def;
    if (node.IsSequence()) return node.as<std::vector<std::string>>();
    if (node.IsScalar()) return splitCommand(node.as<std::string>());
    return {};
}

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["socket_path"] = rhs.socket_path;
        node["max_request_bytes"] = rhs.max_request_bytes;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.socket_path = node["socket_path"].as<std::string>("/run/testrunner/tools.sock");
        rhs.max_request_bytes = node["max_request_bytes"].as<uint32_t>(MAX_REQUEST_SIZE_BYTES);
        return true;
    }
};

template<>
struct convert<RspecConfig> {
    static Node encode(const RspecConfig& rhs) {
        Node node;
        node["command"] = rhs.command;
        node["default_args"] = rhs.default_args;
        return node;
    }

    static bool decode(const Node& node, RspecConfig& rhs) {
        if (!node.IsMap()) return false;
        const RspecConfig defaults;
        rhs.command = decodeCommand(node["command"], defaults.command);
        rhs.default_args = decodeCommand(node["default_args"], defaults.default_args);
        return true;
    }
};

template<>
struct convert<CypressConfig> {
    static Node encode(const CypressConfig& rhs) {
        Node node;
        node["command"] = rhs.command;
        node["working_dir"] = rhs.working_dir;
        node["shell_pipeline"] = rhs.shell_pipeline;
        return node;
    }

    static bool decode(const Node& node, CypressConfig& rhs) {
        if (!node.IsMap()) return false;
        const CypressConfig defaults;
        rhs.command = decodeCommand(node["command"], defaults.command);
        rhs.working_dir = node["working_dir"].as<std::string>(".");
        rhs.shell_pipeline = node["shell_pipeline"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["testrunner"] = to_std_string(spdlog::level::to_string_view(rhs.testrunner));
        node["validation"] = to_std_string(spdlog::level::to_string_view(rhs.validation));
        node["process"]    = to_std_string(spdlog::level::to_string_view(rhs.process));
        node["cypress"]    = to_std_string(spdlog::level::to_string_view(rhs.cypress));
        node["tools"]      = to_std_string(spdlog::level::to_string_view(rhs.tools));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.testrunner = spdlog::level::from_str(node["testrunner"].as<std::string>("info"));
        rhs.validation = spdlog::level::from_str(node["validation"].as<std::string>("info"));
        rhs.process = spdlog::level::from_str(node["process"].as<std::string>("info"));
        rhs.cypress = spdlog::level::from_str(node["cypress"].as<std::string>("warn"));
        rhs.tools = spdlog::level::from_str(node["tools"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystems"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystems"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/testrunner");
        if (const auto levels = node["levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

} // namespace YAML
