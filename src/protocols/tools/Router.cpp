#include "protocols/tools/Router.hpp"
#include "runner/TestRunner.hpp"
#include "runner/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <limits>
#include <stdexcept>

using namespace tr::tools;
using namespace tr::runner;
using namespace tr::logging;
using json = nlohmann::json;

namespace {

constexpr std::string_view INSTRUCTIONS =
    "Test runner server. Tools: run_rspec (run RSpec for one spec file, optionally at line numbers), "
    "run_rspec_args (run RSpec with an allowlisted argument list), "
    "run_cypress (run one Cypress spec and return its parsed JSON report).";

json fileSchema(const std::string& description) {
    return {
        {"type", "object"},
        {"properties", {{"file", {{"type", "string"}, {"description", description}}}}},
        {"required", {"file"}}
    };
}

}

json ToolResult::toJson() const {
    if (ok()) return {{"ok", true}, {"content", content}};
    return {
        {"ok", false},
        {"error", {{"code", static_cast<int>(error->code)}, {"message", error->message}}}
    };
}

void Router::registerTool(ToolInfo info) {
    if (tools_.contains(info.name)) {
        LogRegistry::tools()->warn("[Router] Tool '{}' already registered; replacing handler", info.name);
    } else {
        order_.push_back(info.name);
    }
    LogRegistry::tools()->debug("[Router] Registered tool '{}'", info.name);
    tools_[info.name] = std::move(info);
}

ToolResult Router::call(const std::string& name, const json& arguments) const {
    const auto it = tools_.find(name);
    if (it == tools_.end()) return ToolResult::failure(ErrorCode::MethodNotFound, fmt::format("Unknown tool: {}", name));

    LogRegistry::tools()->debug("[Router] Calling tool '{}'", name);

    try {
        return ToolResult::success(it->second.handler(arguments));
    } catch (const std::invalid_argument& e) {
        return ToolResult::failure(ErrorCode::InvalidParams, e.what());
    } catch (const InternalError& e) {
        LogRegistry::tools()->error("[Router] Tool '{}' failed: {}", name, e.what());
        return ToolResult::failure(ErrorCode::InternalError, e.what());
    } catch (const std::exception& e) {
        LogRegistry::tools()->error("[Router] Tool '{}' raised: {}", name, e.what());
        return ToolResult::failure(ErrorCode::InternalError, e.what());
    }
}

json Router::listTools() const {
    json tools = json::array();
    for (const auto& name : order_) {
        const auto& info = tools_.at(name);
        tools.push_back({{"name", info.name}, {"description", info.description}, {"inputSchema", info.input_schema}});
    }
    return tools;
}

json Router::serverInfo() {
    return {
        {"name", SERVER_NAME},
        {"version", SERVER_VERSION},
        {"instructions", INSTRUCTIONS}
    };
}

json Router::handleRequest(const json& request) const {
    if (!request.is_object())
        return ToolResult::failure(ErrorCode::InvalidParams, "Request must be a JSON object").toJson();

    const auto m = request.find("method");
    if (m != request.end() && !m->is_string())
        return ToolResult::failure(ErrorCode::InvalidParams, "Field 'method' must be a string").toJson();
    const auto method = m == request.end() ? std::string{"tools/call"} : m->get<std::string>();

    if (method == "tools/list") return {{"ok", true}, {"tools", listTools()}};
    if (method == "server/info") return {{"ok", true}, {"server", serverInfo()}};

    if (method != "tools/call")
        return ToolResult::failure(ErrorCode::MethodNotFound, fmt::format("Unknown method: {}", method)).toJson();

    const auto tool = request.find("tool");
    if (tool == request.end() || !tool->is_string())
        return ToolResult::failure(ErrorCode::InvalidParams, "Field 'tool' must be a string").toJson();

    const auto args = request.find("arguments");
    if (args != request.end() && !args->is_object())
        return ToolResult::failure(ErrorCode::InvalidParams, "Field 'arguments' must be an object").toJson();

    return call(tool->get<std::string>(), args == request.end() ? json::object() : *args).toJson();
}

std::string tr::tools::requireString(const json& arguments, const std::string& key) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_string())
        throw InvalidParams(fmt::format("Argument '{}' is required and must be a string", key));
    return it->get<std::string>();
}

std::vector<std::string> tr::tools::requireStringArray(const json& arguments, const std::string& key) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_array())
        throw InvalidParams(fmt::format("Argument '{}' is required and must be an array of strings", key));

    std::vector<std::string> out;
    out.reserve(it->size());
    for (const auto& v : *it) {
        if (!v.is_string()) throw InvalidParams(fmt::format("Argument '{}' must contain only strings", key));
        out.push_back(v.get<std::string>());
    }
    return out;
}

std::vector<int64_t> tr::tools::optionalIntegerArray(const json& arguments, const std::string& key) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) return {};
    if (!it->is_array()) throw InvalidParams(fmt::format("Argument '{}' must be an array of integers", key));

    std::vector<int64_t> out;
    out.reserve(it->size());
    for (const auto& v : *it) {
        if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw InvalidParams(fmt::format("Argument '{}' contains an out of range value {}", key, v.dump()));
        if (!v.is_number_integer()) throw InvalidParams(fmt::format("Argument '{}' must contain only integers", key));
        out.push_back(v.get<int64_t>());
    }
    return out;
}

void tr::tools::registerTestRunnerTools(Router& router, const std::shared_ptr<const TestRunner>& runner) {
    router.registerTool({
        "run_rspec",
        "Run RSpec tests for one spec file, optionally limited to the given line numbers",
        [] {
            auto schema = fileSchema("Spec file to run (e.g. \"spec/models/user_spec.rb\")");
            schema["properties"]["line_numbers"] = {
                {"type", "array"},
                {"items", {{"type", "integer"}, {"minimum", 1}}},
                {"description", "Line numbers of examples or groups to run"}
            };
            return schema;
        }(),
        [runner](const json& args) {
            return runner->runRspec(requireString(args, "file"), optionalIntegerArray(args, "line_numbers"));
        }
    });

    router.registerTool({
        "run_rspec_args",
        "Run RSpec with a raw argument list; only allowlisted flags and spec file paths are accepted",
        {
            {"type", "object"},
            {"properties", {{"args", {{"type", "array"}, {"items", {{"type", "string"}}}}}}},
            {"required", {"args"}}
        },
        [runner](const json& args) { return runner->runRspecArguments(requireStringArray(args, "args")); }
    });

    router.registerTool({
        "run_cypress",
        "Run one Cypress spec and return its JSON report",
        fileSchema("Cypress spec to run (e.g. \"cypress/e2e/login.cy.js\")"),
        [runner](const json& args) { return runner->runCypress(requireString(args, "file")); }
    });
}
