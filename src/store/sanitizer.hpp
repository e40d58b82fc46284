#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "store/element.hpp"

namespace elrelay::store {

// Size ceilings applied during sanitization (bytes)
struct SanitizerLimits {
    size_t max_body_bytes = 50000;
    size_t max_excerpt_bytes = 10000;
    size_t max_media_bytes = 1000000;
};

inline constexpr const char* kTruncationMarker = "... [TRUNCATED]";
inline constexpr const char* kRedactionToken = "[REDACTED]";

struct SanitizeResult {
    bool success = false;
    Element element;
    std::string error;   // set when success is false
};

// Validate a raw wire record and produce a sanitized copy of it.
// Pure: the input is never modified or aliased.
SanitizeResult sanitize(const nlohmann::json& raw, const SanitizerLimits& limits = {});

// Remove <script>...</script> blocks and inline on*="..." handlers.
// Best-effort pattern removal, not an HTML parser.
std::string scrub_markup(const std::string& html);

// True when the lowercase key contains password, token, secret, key or auth
bool is_sensitive_attribute(const std::string& name);

// Cut to max_bytes (on a UTF-8 boundary) and append the truncation marker
// when anything was cut.
std::string cap_text(const std::string& text, size_t max_bytes);

} // namespace elrelay::store
