#pragma once
// Element resources: the resource-read surface over the query facade
//
//   element://list             summaries of all live elements
//   element://{id}             full element record
//   element://{id}/screenshot  base64 screenshot blob

#include <optional>
#include <string>
#include "mcp/types.hpp"
#include "query/query_facade.hpp"

namespace elrelay::mcp::resources {

constexpr const char* LIST_URI = "element://list";

struct ElementUri {
    std::string id;
    std::string sub_resource;   // empty or "screenshot"
};

// Split element://{id}[/{sub}]; nullopt for anything else
std::optional<ElementUri> parse_element_uri(const std::string& uri);

// Host part of an http(s) URL, or the URL itself if it has none
std::string host_of(const std::string& url);

json list(query::QueryFacade& facade);
ResourceResult read(query::QueryFacade& facade, const std::string& uri);

} // namespace elrelay::mcp::resources
