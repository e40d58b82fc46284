#pragma once
// Element tools: the tool-call surface over the query facade

#include <string>
#include <unordered_map>
#include <vector>
#include "mcp/types.hpp"
#include "query/query_facade.hpp"

namespace elrelay::mcp::tools {

// list_captured_elements, get_element_details, search_elements,
// remove_element, clear_all_elements, get_storage_stats, get_server_status
void register_schemas(std::vector<ToolSchema>& tools);
void register_handlers(query::QueryFacade& facade,
                       std::unordered_map<std::string, ToolHandler>& handlers);

} // namespace elrelay::mcp::tools
