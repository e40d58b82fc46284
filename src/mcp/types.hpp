#pragma once
// MCP tool schema and result types

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace elrelay::mcp {

using json = nlohmann::json;

// Tool definition for tools/list
struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

struct ToolResult {
    bool is_error = false;
    std::string content;      // text returned to the client

    static ToolResult ok(const std::string& text) {
        return {false, text};
    }

    static ToolResult error(const std::string& message) {
        return {true, message};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

// Outcome of resources/read: either contents or a JSON-RPC error
struct ResourceResult {
    bool success = false;
    json contents = json::array();
    int error_code = 0;
    std::string error;
};

} // namespace elrelay::mcp
