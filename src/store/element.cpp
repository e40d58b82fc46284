#include "store/element.hpp"

using json = nlohmann::json;

namespace elrelay::store {

json Element::to_json(bool include_media) const {
    json j;
    j["id"] = id;
    j["timestamp"] = captured_at;
    j["url"] = source_ref;
    j["selector"] = label;
    j["html"] = body;
    j["text"] = excerpt;
    j["attributes"] = attributes;
    for (const char* key : kAuxiliaryKeys) {
        if (auxiliary.contains(key)) {
            j[key] = auxiliary[key];
        }
    }
    if (include_media && has_media()) {
        j["screenshot"] = media;
    }
    if (media_truncated) {
        j["_screenshotTruncated"] = true;
    }
    return j;
}

json summarize(const Element& element) {
    json summary;
    summary["id"] = element.id;
    summary["timestamp"] = element.captured_at;
    summary["url"] = element.source_ref;
    summary["selector"] = element.label;
    summary["text"] = utf8_prefix(element.excerpt, kSummaryTextBytes);
    summary["bounds"] = element.auxiliary.value("bounds", json());
    summary["hasScreenshot"] = element.has_media();
    return summary;
}

std::string utf8_prefix(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) {
        return s;
    }
    size_t cut = max_bytes;
    // Back off over continuation bytes (10xxxxxx) to a sequence start
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return s.substr(0, cut);
}

std::string dump_json(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace elrelay::store
