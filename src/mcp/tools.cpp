#include "mcp/tools.hpp"
#include "store/element.hpp"
#include <optional>
#include <spdlog/spdlog.h>

namespace elrelay::mcp::tools {

namespace {

json no_arguments() {
    return {
        {"type", "object"},
        {"properties", json::object()},
        {"required", json::array()}
    };
}

json single_string_argument(const std::string& name, const std::string& description) {
    return {
        {"type", "object"},
        {"properties", {
            {name, {{"type", "string"}, {"description", description}}}
        }},
        {"required", {name}}
    };
}

// Required string argument; nullopt when missing or not a string
std::optional<std::string> string_arg(const json& args, const char* name) {
    if (!args.is_object()) return std::nullopt;
    auto it = args.find(name);
    if (it == args.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::string pretty(const json& j) {
    return store::dump_json(j, 2);
}

} // namespace

void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "list_captured_elements",
        "List all captured elements with summary information",
        no_arguments()
    });
    tools.push_back({
        "get_element_details",
        "Get full details for a specific captured element",
        single_string_argument("id", "Element ID")
    });
    tools.push_back({
        "search_elements",
        "Search captured elements by selector, text, or URL",
        single_string_argument("query", "Search query (searches selector, text, HTML, and URL)")
    });
    tools.push_back({
        "remove_element",
        "Remove a captured element by ID",
        single_string_argument("id", "Element ID to remove")
    });
    tools.push_back({
        "clear_all_elements",
        "Clear all captured elements from storage",
        no_arguments()
    });
    tools.push_back({
        "get_storage_stats",
        "Get storage statistics (count, TTL, timestamps)",
        no_arguments()
    });
    tools.push_back({
        "get_server_status",
        "Get WebSocket server status and connection info",
        no_arguments()
    });
}

void register_handlers(query::QueryFacade& facade,
                       std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["list_captured_elements"] = [&facade](const json&) {
        return ToolResult::ok(pretty(facade.list_summaries()));
    };

    handlers["get_element_details"] = [&facade](const json& args) {
        auto id = string_arg(args, "id");
        if (!id) {
            return ToolResult::error("Error: missing required argument 'id'");
        }
        // Screenshot is served separately as element://{id}/screenshot
        auto details = facade.detail(*id, false);
        if (!details) {
            return ToolResult::error("Error: Element not found: " + *id);
        }
        return ToolResult::ok(pretty(*details));
    };

    handlers["search_elements"] = [&facade](const json& args) {
        auto query = string_arg(args, "query");
        if (!query) {
            return ToolResult::error("Error: missing required argument 'query'");
        }
        return ToolResult::ok(pretty(facade.search(*query)));
    };

    handlers["remove_element"] = [&facade](const json& args) {
        auto id = string_arg(args, "id");
        if (!id) {
            return ToolResult::error("Error: missing required argument 'id'");
        }
        if (facade.remove(*id)) {
            spdlog::info("Element {} removed by MCP client", *id);
            return ToolResult::ok("Successfully removed element: " + *id);
        }
        return ToolResult::ok("Element not found: " + *id);
    };

    handlers["clear_all_elements"] = [&facade](const json&) {
        size_t count = facade.clear();
        spdlog::info("MCP client cleared {} element(s)", count);
        return ToolResult::ok("All elements cleared from storage");
    };

    handlers["get_storage_stats"] = [&facade](const json&) {
        return ToolResult::ok(pretty(facade.stats().to_json()));
    };

    handlers["get_server_status"] = [&facade](const json&) {
        return ToolResult::ok(pretty(facade.channel_status().to_json()));
    };
}

} // namespace elrelay::mcp::tools
