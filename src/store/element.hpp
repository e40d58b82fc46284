#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace elrelay::store {

// A captured page element, after sanitization.
// Field names follow the store's vocabulary; to_json() maps them back to the
// wire names the capture extension uses (url, selector, html, text, screenshot).
struct Element {
    std::string id;
    int64_t captured_at = 0;       // epoch ms, producer clock
    std::string source_ref;        // page URL
    std::string label;             // CSS selector
    std::string body;              // outer HTML
    std::string excerpt;           // inner text
    std::map<std::string, std::string> attributes;
    nlohmann::json auxiliary = nlohmann::json::object();  // computed, bounds, context
    std::string media;             // base64 screenshot
    bool media_truncated = false;

    bool has_media() const { return !media.empty(); }

    // Full record in wire form. The screenshot key is present only when
    // include_media is set and the element has one.
    nlohmann::json to_json(bool include_media = true) const;
};

// Keys of Element::auxiliary that are carried through from the wire record
inline constexpr const char* kAuxiliaryKeys[] = {"computed", "bounds", "context"};

// Listing summary: id, timestamp, url, selector, text prefix, bounds, hasScreenshot
nlohmann::json summarize(const Element& element);

// Maximum number of bytes of text carried in a summary
inline constexpr size_t kSummaryTextBytes = 100;

// Longest prefix of s that is at most max_bytes long and does not split a
// UTF-8 sequence.
std::string utf8_prefix(const std::string& s, size_t max_bytes);

// Serialize for transport; invalid UTF-8 is replaced rather than thrown on.
std::string dump_json(const nlohmann::json& j, int indent = -1);

} // namespace elrelay::store
