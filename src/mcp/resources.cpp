#include "mcp/resources.hpp"
#include "mcp/protocol.hpp"
#include "store/element.hpp"

namespace elrelay::mcp::resources {

namespace {

constexpr const char* kScheme = "element://";

ResourceResult fail(int code, const std::string& message) {
    ResourceResult result;
    result.error_code = code;
    result.error = message;
    return result;
}

ResourceResult text_contents(const std::string& uri, const json& body) {
    ResourceResult result;
    result.success = true;
    result.contents.push_back({
        {"uri", uri},
        {"mimeType", "application/json"},
        {"text", store::dump_json(body, 2)}
    });
    return result;
}

} // namespace

std::optional<ElementUri> parse_element_uri(const std::string& uri) {
    const std::string scheme = kScheme;
    if (uri.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }

    std::string rest = uri.substr(scheme.size());
    ElementUri parsed;
    size_t slash = rest.find('/');
    if (slash == std::string::npos) {
        parsed.id = rest;
    } else {
        parsed.id = rest.substr(0, slash);
        parsed.sub_resource = rest.substr(slash + 1);
        if (parsed.sub_resource.empty()) {
            return std::nullopt;
        }
    }
    if (parsed.id.empty()) {
        return std::nullopt;
    }
    return parsed;
}

std::string host_of(const std::string& url) {
    size_t start = url.find("://");
    if (start == std::string::npos) {
        return url;
    }
    start += 3;
    size_t end = url.find_first_of("/?#", start);
    std::string host = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    // Drop userinfo, then port
    size_t at = host.rfind('@');
    if (at != std::string::npos) {
        host = host.substr(at + 1);
    }
    size_t colon = host.find(':');
    if (colon != std::string::npos) {
        host = host.substr(0, colon);
    }
    return host;
}

json list(query::QueryFacade& facade) {
    auto elements = facade.elements();

    json resources = json::array();
    resources.push_back({
        {"uri", LIST_URI},
        {"name", "Captured Elements List"},
        {"description", "List of " + std::to_string(elements.size()) + " captured elements"},
        {"mimeType", "application/json"}
    });

    for (const auto& element : elements) {
        resources.push_back({
            {"uri", std::string(kScheme) + element.id},
            {"name", "Element: " + element.label},
            {"description", "Captured from " + host_of(element.source_ref)},
            {"mimeType", "application/json"}
        });

        if (element.has_media()) {
            resources.push_back({
                {"uri", query::media_uri(element.id)},
                {"name", "Screenshot: " + element.label},
                {"description", "Visual capture of " + element.label},
                {"mimeType", "image/png"}
            });
        }
    }
    return {{"resources", resources}};
}

ResourceResult read(query::QueryFacade& facade, const std::string& uri) {
    if (uri == LIST_URI) {
        return text_contents(uri, facade.list_summaries());
    }

    auto parsed = parse_element_uri(uri);
    if (!parsed) {
        return fail(error::INVALID_PARAMS, "Invalid resource URI: " + uri);
    }

    if (parsed->sub_resource.empty()) {
        auto details = facade.detail(parsed->id, true);
        if (!details) {
            return fail(error::RESOURCE_NOT_FOUND, "Element not found: " + parsed->id);
        }
        return text_contents(uri, *details);
    }

    if (parsed->sub_resource != "screenshot") {
        return fail(error::INVALID_PARAMS, "Unknown sub-resource: " + parsed->sub_resource);
    }

    auto media = facade.media(parsed->id);
    if (!media.found) {
        return fail(error::RESOURCE_NOT_FOUND, "Element not found: " + parsed->id);
    }
    if (!media.has_media) {
        return fail(error::RESOURCE_NOT_FOUND, "No screenshot available for element: " + parsed->id);
    }

    ResourceResult result;
    result.success = true;
    result.contents.push_back({
        {"uri", uri},
        {"mimeType", "image/png"},
        {"blob", media.data}
    });
    return result;
}

} // namespace elrelay::mcp::resources
