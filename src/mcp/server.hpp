#pragma once
// MCP server: JSON-RPC 2.0 over newline-delimited stdio
//
// Methods: initialize, notifications/initialized, ping, tools/list,
// tools/call, resources/list, resources/read.

#include <atomic>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>
#include "mcp/protocol.hpp"
#include "mcp/types.hpp"
#include "query/query_facade.hpp"

namespace elrelay::mcp {

// Default ceiling for one request line
constexpr size_t kDefaultMaxLineBytes = 4 * 1024 * 1024;

class Server {
public:
    explicit Server(query::QueryFacade& facade, size_t max_line_bytes = kDefaultMaxLineBytes);

    // Handle one request; nullopt for notifications
    std::optional<json> handle_request(const json& request);

    // Handle one line of input; nullopt when nothing should be written
    std::optional<std::string> handle_line(const std::string& line);

    // Feed raw input; complete lines are answered on out. A line longer
    // than max_line_bytes is answered with a parse error and discarded.
    void consume(const char* data, size_t size, std::ostream& out);

    // Read requests from in_fd until EOF or stop(), writing replies to out
    void run(int in_fd, std::ostream& out);
    // Ask run() to return; may be called before run() starts
    void stop() { stop_requested_ = true; }
    bool running() const { return running_; }

    const std::vector<ToolSchema>& tools() const { return tools_; }

private:
    query::QueryFacade& facade_;
    size_t max_line_bytes_;
    std::string buffer_;
    bool discarding_ = false;   // inside an oversize line, until its newline

    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    void write_line(std::ostream& out, const std::string& line);
    void reject_oversize(std::ostream& out);

    json handle_initialize(const json& params, const json& id);
    json handle_tools_list(const json& params, const json& id);
    json handle_tools_call(const json& params, const json& id);
    json handle_resources_list(const json& params, const json& id);
    json handle_resources_read(const json& params, const json& id);
};

} // namespace elrelay::mcp
