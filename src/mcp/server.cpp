#include "mcp/server.hpp"
#include "mcp/resources.hpp"
#include "mcp/tools.hpp"
#include "core/version.hpp"
#include "store/element.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace elrelay::mcp {

namespace {

constexpr int kPollIntervalMs = 200;

// tools/call result: one text content block, isError only on failure
json tool_result(const ToolResult& result) {
    json content = json::array();
    content.push_back({{"type", "text"}, {"text", result.content}});

    json response = {{"content", content}};
    if (result.is_error) {
        response["isError"] = true;
    }
    return response;
}

} // namespace

Server::Server(query::QueryFacade& facade, size_t max_line_bytes)
    : facade_(facade), max_line_bytes_(max_line_bytes) {
    tools::register_schemas(tools_);
    tools::register_handlers(facade_, handlers_);
}

std::optional<json> Server::handle_request(const json& request) {
    std::string error_msg;
    auto parsed = parse_request(request, error_msg);
    if (!parsed) {
        json id = request.is_object() ? request.value("id", json()) : json();
        return make_error(id, error::INVALID_REQUEST, error_msg);
    }

    const Request& info = *parsed;
    spdlog::debug("MCP request: {}", info.method);

    if (info.is_notification) {
        // notifications/initialized, notifications/cancelled, ...
        return std::nullopt;
    }

    try {
        if (info.method == "initialize") {
            return handle_initialize(info.params, info.id);
        } else if (info.method == "ping") {
            return make_result(info.id, json::object());
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.params, info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        } else if (info.method == "resources/list") {
            return handle_resources_list(info.params, info.id);
        } else if (info.method == "resources/read") {
            return handle_resources_read(info.params, info.id);
        }
    } catch (const std::exception& e) {
        spdlog::error("MCP {} failed: {}", info.method, e.what());
        return make_error(info.id, error::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }

    return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
}

std::optional<std::string> Server::handle_line(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        return store::dump_json(make_error(json(), error::PARSE_ERROR,
                                           std::string("JSON parse error: ") + e.what()));
    }

    auto response = handle_request(request);
    if (!response) {
        return std::nullopt;
    }
    return store::dump_json(*response);
}

void Server::run(int in_fd, std::ostream& out) {
    running_ = true;
    spdlog::info("MCP server started (stdio transport)");

    char chunk[65536];

    while (!stop_requested_) {
        pollfd pfd{};
        pfd.fd = in_fd;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("MCP poll() failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(in_fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            spdlog::error("MCP read() failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            spdlog::info("MCP client closed stdin");
            break;
        }
        consume(chunk, static_cast<size_t>(n), out);
    }

    running_ = false;
    spdlog::info("MCP server stopped");
}

void Server::consume(const char* data, size_t size, std::ostream& out) {
    buffer_.append(data, size);

    // Message framing: newline-delimited JSON
    size_t pos;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);

        if (discarding_) {
            // Tail of a line already rejected
            discarding_ = false;
            continue;
        }
        if (line.size() > max_line_bytes_) {
            reject_oversize(out);
            continue;
        }

        auto response = handle_line(line);
        if (response) {
            write_line(out, *response);
        }
    }

    if (buffer_.size() > max_line_bytes_) {
        if (!discarding_) {
            reject_oversize(out);
            discarding_ = true;
        }
        buffer_.clear();
    }
}

void Server::reject_oversize(std::ostream& out) {
    spdlog::warn("MCP request exceeds {} bytes, discarding it", max_line_bytes_);
    write_line(out, store::dump_json(make_error(
        json(), error::PARSE_ERROR,
        "Request exceeds " + std::to_string(max_line_bytes_) + " bytes")));
}

void Server::write_line(std::ostream& out, const std::string& line) {
    out << line << '\n';
    out.flush();
}

json Server::handle_initialize(const json&, const json& id) {
    json capabilities = {
        {"tools", json::object()},
        {"resources", json::object()}
    };
    return make_result(id, {
        {"protocolVersion", PROTOCOL_VERSION},
        {"serverInfo", {
            {"name", SERVER_NAME},
            {"version", SERVER_VERSION}
        }},
        {"capabilities", capabilities}
    });
}

json Server::handle_tools_list(const json&, const json& id) {
    json tools_array = json::array();
    for (const auto& tool : tools_) {
        tools_array.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }
    return make_result(id, {{"tools", tools_array}});
}

json Server::handle_tools_call(const json& params, const json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return make_error(id, error::INVALID_PARAMS, "Missing tool name");
    }

    std::string name = params["name"].get<std::string>();
    json arguments = params.value("arguments", json::object());

    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return make_result(id, tool_result(ToolResult::error("Unknown tool: " + name)));
    }

    return make_result(id, tool_result(it->second(arguments)));
}

json Server::handle_resources_list(const json&, const json& id) {
    return make_result(id, resources::list(facade_));
}

json Server::handle_resources_read(const json& params, const json& id) {
    if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
        return make_error(id, error::INVALID_PARAMS, "Missing resource uri");
    }

    auto result = resources::read(facade_, params["uri"].get<std::string>());
    if (!result.success) {
        return make_error(id, result.error_code, result.error);
    }
    return make_result(id, {{"contents", result.contents}});
}

} // namespace elrelay::mcp
