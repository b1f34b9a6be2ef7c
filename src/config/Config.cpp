#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <fmt/core.h>

namespace tr::config {

namespace {

void requireCommand(const std::vector<std::string>& command, const std::string& section) {
    if (command.empty()) throw std::runtime_error(fmt::format("Config: '{}.command' must not be empty", section));
    for (const auto& token : command)
        if (token.empty()) throw std::runtime_error(fmt::format("Config: '{}.command' contains an empty token", section));
}

Config fromRoot(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
    if (auto node = root["rspec"]) YAML::convert<RspecConfig>::decode(node, cfg.rspec);
    if (auto node = root["cypress"]) YAML::convert<CypressConfig>::decode(node, cfg.cypress);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    requireCommand(cfg.rspec.command, "rspec");
    if (cfg.cypress.shell_pipeline.empty()) requireCommand(cfg.cypress.command, "cypress");
    if (cfg.server.socket_path.empty()) throw std::runtime_error("Config: 'server.socket_path' must not be empty");

    return cfg;
}

}

Config loadConfig(const std::string& path) {
    return fromRoot(YAML::LoadFile(path));
}

Config parseConfig(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

std::vector<std::string> splitCommand(const std::string& command) {
    std::vector<std::string> tokens;
    std::istringstream in(command);
    std::string token;
    while (in >> token) tokens.push_back(token);
    return tokens;
}

std::string Config::dump() const {
    YAML::Node root;
    root["server"] = server;
    root["rspec"] = rspec;
    root["cypress"] = cypress;
    root["logging"] = logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

} // namespace tr::config
