#include "relay/message_router.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace elrelay::relay {

json make_error_reply(const std::string& error) {
    json reply;
    reply["type"] = msg::ERROR;
    reply["error"] = error;
    return reply;
}

json MessageRouter::handle(SessionId session, const json& message) const {
    if (!message.is_object()) {
        return make_error_reply("message must be a JSON object");
    }

    auto type_it = message.find("type");
    if (type_it == message.end() || !type_it->is_string()) {
        return make_error_reply("message is missing a string 'type'");
    }
    const std::string type = type_it->get<std::string>();
    spdlog::debug("Message from session {}: {}", session, type);

    json reply;
    auto it = handlers_.find(type);
    if (it == handlers_.end()) {
        spdlog::warn("Unknown message type from session {}: {}", session, type);
        reply = make_error_reply("Unknown message type: " + type);
    } else {
        try {
            reply = it->second(session, message);
        } catch (const std::exception& e) {
            spdlog::error("Handler for {} failed: {}", type, e.what());
            reply = make_error_reply(e.what());
        }
    }

    if (message.contains("requestId")) {
        reply["requestId"] = message["requestId"];
    }
    return reply;
}

json MessageRouter::handle_text(SessionId session, const std::string& text) const {
    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error& e) {
        spdlog::warn("Unparseable message from session {}: {}", session, e.what());
        return make_error_reply(std::string("invalid JSON: ") + e.what());
    }
    return handle(session, message);
}

void MessageRouter::register_handler(const std::string& type, Handler handler) {
    handlers_[type] = std::move(handler);
}

} // namespace elrelay::relay
