#include "query/query_facade.hpp"

using json = nlohmann::json;

namespace elrelay::query {

json ChannelStatus::to_json() const {
    return {
        {"running", running},
        {"port", port},
        {"clients", clients}
    };
}

std::string media_uri(const std::string& id) {
    return "element://" + id + "/screenshot";
}

QueryFacade::QueryFacade(store::ElementStore& store, StatusSource status_source)
    : store_(store), status_source_(std::move(status_source)) {}

json QueryFacade::list_summaries() {
    json summaries = json::array();
    for (const auto& element : store_.list()) {
        summaries.push_back(store::summarize(element));
    }
    return summaries;
}

std::optional<json> QueryFacade::detail(const std::string& id, bool include_media) {
    auto element = store_.get(id);
    if (!element) {
        return std::nullopt;
    }

    json details = element->to_json(include_media);
    if (!include_media) {
        details["_hasScreenshot"] = element->has_media();
        details["_screenshotAvailable"] = element->has_media() ? json(media_uri(id)) : json(nullptr);
    }
    return details;
}

MediaResult QueryFacade::media(const std::string& id) {
    MediaResult result;
    auto element = store_.get(id);
    if (!element) {
        return result;
    }
    result.found = true;
    result.has_media = element->has_media();
    if (result.has_media) {
        result.data = std::move(element->media);
    }
    return result;
}

json QueryFacade::search(const std::string& query) {
    json summaries = json::array();
    for (const auto& element : store_.search(query)) {
        summaries.push_back(store::summarize(element));
    }
    return summaries;
}

std::vector<store::Element> QueryFacade::elements() {
    return store_.list();
}

bool QueryFacade::remove(const std::string& id) {
    return store_.remove(id);
}

size_t QueryFacade::clear() {
    return store_.clear();
}

store::StoreStats QueryFacade::stats() {
    return store_.stats();
}

ChannelStatus QueryFacade::channel_status() const {
    if (!status_source_) {
        return {};
    }
    return status_source_();
}

} // namespace elrelay::query
