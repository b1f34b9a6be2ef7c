#pragma once

#include "protocols/tools/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tr::runner { class TestRunner; }

namespace tr::tools {

class Router {
public:
    void registerTool(ToolInfo info);

    // Runs one tool. Handler exceptions are mapped onto error codes; nothing escapes.
    [[nodiscard]] ToolResult call(const std::string& name, const nlohmann::json& arguments) const;

    [[nodiscard]] nlohmann::json listTools() const;
    [[nodiscard]] static nlohmann::json serverInfo();

    // Decodes one request frame ({"method": "tools/call" | "tools/list" | "server/info", ...})
    [[nodiscard]] nlohmann::json handleRequest(const nlohmann::json& request) const;

private:
    std::vector<std::string> order_;
    std::unordered_map<std::string, ToolInfo> tools_;
};

void registerTestRunnerTools(Router& router, const std::shared_ptr<const runner::TestRunner>& runner);

// Argument accessors for tool handlers; wrong or missing fields throw runner::InvalidParams
[[nodiscard]] std::string requireString(const nlohmann::json& arguments, const std::string& key);
[[nodiscard]] std::vector<std::string> requireStringArray(const nlohmann::json& arguments, const std::string& key);
[[nodiscard]] std::vector<int64_t> optionalIntegerArray(const nlohmann::json& arguments, const std::string& key);

} // namespace tr::tools
