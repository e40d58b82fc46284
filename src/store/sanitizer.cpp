#include "store/sanitizer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace elrelay::store {

namespace {

const char* const kSensitiveFragments[] = {"password", "token", "secret", "key", "auth"};
const char* const kAllowedSchemes[] = {"http://", "https://"};

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_word_char(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_';
}

bool has_allowed_scheme(const std::string& url) {
    std::string lower = to_lower(url);
    for (const char* scheme : kAllowedSchemes) {
        if (lower.rfind(scheme, 0) == 0) return true;
    }
    return false;
}

SanitizeResult reject(const std::string& error) {
    SanitizeResult result;
    result.error = error;
    return result;
}

// Remove every "<script...>...</script>" block. An opening tag with no
// closing tag is left in place.
std::string strip_script_blocks(const std::string& html) {
    static const std::string kOpen = "<script";
    static const std::string kClose = "</script>";

    std::string lower = to_lower(html);
    std::string out;
    out.reserve(html.size());

    size_t pos = 0;
    while (pos < html.size()) {
        size_t open = lower.find(kOpen, pos);
        if (open == std::string::npos) break;

        size_t after = open + kOpen.size();
        if (after < lower.size() && is_word_char(lower[after])) {
            // "<scripts", "<script_x": not a script tag
            out.append(html, pos, after - pos);
            pos = after;
            continue;
        }

        size_t close = lower.find(kClose, after);
        if (close == std::string::npos) break;

        out.append(html, pos, open - pos);
        pos = close + kClose.size();
    }
    if (pos < html.size()) {
        out.append(html, pos, std::string::npos);
    }
    return out;
}

// Length of an inline handler ` on<word>="..."` starting at i (the
// whitespace), or 0 when none starts there.
size_t event_handler_length(const std::string& html, size_t i) {
    if (!std::isspace(static_cast<unsigned char>(html[i]))) return 0;

    size_t p = i + 1;
    if (p + 2 > html.size()) return 0;
    if (std::tolower(static_cast<unsigned char>(html[p])) != 'o' ||
        std::tolower(static_cast<unsigned char>(html[p + 1])) != 'n') {
        return 0;
    }
    p += 2;

    size_t name_start = p;
    while (p < html.size() && is_word_char(html[p])) ++p;
    if (p == name_start) return 0;

    if (p + 1 >= html.size() || html[p] != '=' || html[p + 1] != '"') return 0;
    size_t close = html.find('"', p + 2);
    if (close == std::string::npos) return 0;

    return close + 1 - i;
}

std::string strip_event_handlers(const std::string& html) {
    std::string out;
    out.reserve(html.size());

    size_t i = 0;
    while (i < html.size()) {
        size_t len = event_handler_length(html, i);
        if (len > 0) {
            i += len;
            continue;
        }
        out.push_back(html[i]);
        ++i;
    }
    return out;
}

bool read_timestamp(const json& value, int64_t& out) {
    if (value.is_number_integer()) {
        out = value.get<int64_t>();
        return true;
    }
    if (value.is_number_unsigned()) {
        auto u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return false;
        out = static_cast<int64_t>(u);
        return true;
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (!std::isfinite(d) || d <= 0 || d >= 9.2e18) return false;
        // Positive fractions below 1 ms still count as a valid capture time
        out = std::max<int64_t>(1, static_cast<int64_t>(d));
        return true;
    }
    return false;
}

} // namespace

std::string scrub_markup(const std::string& html) {
    return strip_event_handlers(strip_script_blocks(html));
}

bool is_sensitive_attribute(const std::string& name) {
    std::string lower = to_lower(name);
    for (const char* fragment : kSensitiveFragments) {
        if (lower.find(fragment) != std::string::npos) return true;
    }
    return false;
}

std::string cap_text(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    return utf8_prefix(text, max_bytes) + kTruncationMarker;
}

SanitizeResult sanitize(const json& raw, const SanitizerLimits& limits) {
    if (!raw.is_object()) {
        return reject("element must be a JSON object");
    }

    for (const char* field : {"id", "timestamp", "url", "selector", "html", "text"}) {
        if (!raw.contains(field)) {
            return reject(std::string("missing required field '") + field + "'");
        }
    }

    const auto& id = raw["id"];
    if (!id.is_string() || id.get_ref<const std::string&>().empty()) {
        return reject("'id' must be a non-empty string");
    }

    int64_t captured_at = 0;
    if (!read_timestamp(raw["timestamp"], captured_at) || captured_at <= 0) {
        return reject("'timestamp' must be a positive number");
    }

    const auto& url = raw["url"];
    if (!url.is_string() || !has_allowed_scheme(url.get_ref<const std::string&>())) {
        return reject("'url' must be an http(s) URL");
    }

    const auto& selector = raw["selector"];
    if (!selector.is_string() || selector.get_ref<const std::string&>().empty()) {
        return reject("'selector' must be a non-empty string");
    }

    if (!raw["html"].is_string()) {
        return reject("'html' must be a string");
    }
    if (!raw["text"].is_string()) {
        return reject("'text' must be a string");
    }

    SanitizeResult result;
    Element& element = result.element;
    element.id = id.get<std::string>();
    element.captured_at = captured_at;
    element.source_ref = url.get<std::string>();
    element.label = selector.get<std::string>();

    if (raw.contains("attributes") && !raw["attributes"].is_null()) {
        const auto& attributes = raw["attributes"];
        if (!attributes.is_object()) {
            return reject("'attributes' must be an object");
        }
        for (auto it = attributes.begin(); it != attributes.end(); ++it) {
            const std::string& name = it.key();
            if (!it.value().is_string()) {
                return reject("attribute '" + name + "' must be a string");
            }
            element.attributes[name] = is_sensitive_attribute(name)
                ? std::string(kRedactionToken)
                : it.value().get<std::string>();
        }
    }

    if (raw.contains("screenshot") && !raw["screenshot"].is_null()) {
        if (!raw["screenshot"].is_string()) {
            return reject("'screenshot' must be a string");
        }
        const auto& media = raw["screenshot"].get_ref<const std::string&>();
        if (media.size() > limits.max_media_bytes) {
            element.media_truncated = true;
        } else {
            element.media = media;
        }
    }

    for (const char* key : kAuxiliaryKeys) {
        if (raw.contains(key) && !raw[key].is_null()) {
            element.auxiliary[key] = raw[key];
        }
    }

    element.body = cap_text(scrub_markup(raw["html"].get<std::string>()), limits.max_body_bytes);
    element.excerpt = cap_text(raw["text"].get<std::string>(), limits.max_excerpt_bytes);

    result.success = true;
    return result;
}

} // namespace elrelay::store
