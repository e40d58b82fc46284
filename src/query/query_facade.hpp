#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "store/element_store.hpp"

namespace elrelay::query {

// State of the producer-facing listener
struct ChannelStatus {
    bool running = false;
    uint16_t port = 0;
    size_t clients = 0;

    nlohmann::json to_json() const;
};

struct MediaResult {
    bool found = false;       // element exists and is live
    bool has_media = false;
    std::string data;         // base64 image when has_media
};

// URI under which an element's screenshot can be read
std::string media_uri(const std::string& id);

// Read/search/stat API over the element store. Both consumer surfaces (MCP
// tools and MCP resources) go through this one class and hold no state of
// their own.
class QueryFacade {
public:
    using StatusSource = std::function<ChannelStatus()>;

    QueryFacade(store::ElementStore& store, StatusSource status_source);

    nlohmann::json list_summaries();
    std::optional<nlohmann::json> detail(const std::string& id, bool include_media);
    MediaResult media(const std::string& id);
    nlohmann::json search(const std::string& query);

    // Live elements, list() order
    std::vector<store::Element> elements();

    bool remove(const std::string& id);
    size_t clear();
    store::StoreStats stats();
    ChannelStatus channel_status() const;

private:
    store::ElementStore& store_;
    StatusSource status_source_;
};

} // namespace elrelay::query
