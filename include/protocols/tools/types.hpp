#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace tr::tools {

inline constexpr std::string_view SERVER_NAME = "testrunner";
inline constexpr std::string_view SERVER_VERSION = "0.1.0";

// JSON-RPC error codes, so MCP-style callers can map them directly
enum class ErrorCode : int {
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603
};

struct ToolError {
    ErrorCode code;
    std::string message;
};

struct ToolResult {
    std::string content;
    std::optional<ToolError> error{std::nullopt};

    [[nodiscard]] bool ok() const { return !error.has_value(); }
    [[nodiscard]] nlohmann::json toJson() const;

    static ToolResult success(std::string text) { return {std::move(text), std::nullopt}; }
    static ToolResult failure(const ErrorCode code, std::string message) {
        return {"", ToolError{code, std::move(message)}};
    }
};

using ToolHandler = std::function<std::string(const nlohmann::json& arguments)>;

struct ToolInfo {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    ToolHandler handler;
};

}
