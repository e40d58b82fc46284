#include "relay/handlers.hpp"
#include "relay/message_router.hpp"
#include "core/version.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace elrelay::relay {

json make_welcome(const store::StoreConfig& config) {
    json welcome;
    welcome["type"] = msg::WELCOME;
    welcome["data"] = {
        {"serverVersion", SERVER_VERSION},
        {"maxElements", config.max_elements},
        {"ttl", config.ttl.count()}
    };
    return welcome;
}

void ElementHandlers::register_handlers(MessageRouter& router) {
    router.register_handler(msg::ELEMENT_CAPTURED,
        [this](SessionId s, const json& m) { return handle_captured(s, m); });
    router.register_handler(msg::GET_ELEMENTS,
        [this](SessionId s, const json& m) { return handle_get_elements(s, m); });
    router.register_handler(msg::REMOVE_ELEMENT,
        [this](SessionId s, const json& m) { return handle_remove(s, m); });
    router.register_handler(msg::CLEAR_ALL,
        [this](SessionId s, const json& m) { return handle_clear(s, m); });
}

json ElementHandlers::handle_captured(SessionId session, const json& message) {
    auto element_it = message.find("element");
    if (element_it == message.end()) {
        return make_error_reply("Invalid element: missing 'element'");
    }

    auto result = context_.store.admit(*element_it);
    if (!result.admitted()) {
        spdlog::warn("Rejected element from session {}: {}", session, result.error);
        return make_error_reply("Invalid element: " + result.error);
    }

    spdlog::info("Stored element {} ({}) from session {}", result.id, result.label, session);

    json ack;
    ack["type"] = msg::ELEMENT_STORED;
    ack["data"] = {
        {"id", result.id},
        {"selector", result.label},
        {"timestamp", result.captured_at}
    };
    if (result.evicted_id) {
        ack["data"]["evictedId"] = *result.evicted_id;
    }

    json notification;
    notification["type"] = msg::ELEMENT_ADDED;
    notification["data"] = {
        {"id", result.id},
        {"selector", result.label},
        {"url", element_it->value("url", "")}
    };
    size_t delivered = context_.sessions.broadcast(notification, session);
    spdlog::debug("ELEMENT_ADDED {} delivered to {} session(s)", result.id, delivered);

    return ack;
}

json ElementHandlers::handle_get_elements(SessionId, const json&) {
    json elements = json::array();
    for (const auto& element : context_.store.list()) {
        elements.push_back(element.to_json());
    }

    json reply;
    reply["type"] = msg::ELEMENTS_LIST;
    reply["elements"] = std::move(elements);
    return reply;
}

json ElementHandlers::handle_remove(SessionId session, const json& message) {
    auto id_it = message.find("id");
    if (id_it == message.end() || !id_it->is_string() || id_it->get_ref<const std::string&>().empty()) {
        return make_error_reply("REMOVE_ELEMENT requires a string 'id'");
    }
    const std::string id = id_it->get<std::string>();

    bool removed = context_.store.remove(id);
    spdlog::debug("Session {} removed {}: {}", session, id, removed);

    json reply;
    reply["type"] = msg::ELEMENT_REMOVED;
    reply["id"] = id;
    reply["removed"] = removed;
    return reply;
}

json ElementHandlers::handle_clear(SessionId session, const json&) {
    size_t count = context_.store.clear();
    spdlog::debug("Session {} cleared {} element(s)", session, count);

    json reply;
    reply["type"] = msg::ALL_CLEARED;
    reply["count"] = count;
    return reply;
}

} // namespace elrelay::relay
