#pragma once
// JSON-RPC 2.0 envelopes for the MCP stdio channel

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace elrelay::mcp {

using json = nlohmann::json;

constexpr const char* PROTOCOL_VERSION = "2024-11-05";

namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    constexpr int RESOURCE_NOT_FOUND = -32002;
}

inline json make_result(const json& id, const json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

inline json make_error(const json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

struct Request {
    std::string method;
    json params = json::object();
    json id;                      // null for notifications
    bool is_notification = false; // no id member: nothing is sent back
};

// Unpack a request envelope. On a malformed envelope returns nullopt and
// sets error to the reason.
inline std::optional<Request> parse_request(const json& envelope, std::string& error) {
    if (!envelope.is_object()) {
        error = "Request must be a JSON object";
        return std::nullopt;
    }
    auto version = envelope.find("jsonrpc");
    if (version == envelope.end() || *version != "2.0") {
        error = "Missing or invalid jsonrpc version";
        return std::nullopt;
    }
    auto method = envelope.find("method");
    if (method == envelope.end() || !method->is_string()) {
        error = "Missing or invalid method";
        return std::nullopt;
    }

    Request request;
    request.method = method->get<std::string>();
    auto params = envelope.find("params");
    if (params != envelope.end() && !params->is_null()) {
        request.params = *params;
    }
    auto id = envelope.find("id");
    request.is_notification = id == envelope.end();
    if (!request.is_notification) {
        request.id = *id;
    }
    return request;
}

} // namespace elrelay::mcp
