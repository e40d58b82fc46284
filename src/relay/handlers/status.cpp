#include "relay/handlers.hpp"
#include "relay/message_router.hpp"
#include <chrono>

using json = nlohmann::json;

namespace elrelay::relay {

void StatusHandlers::register_handlers(MessageRouter& router) {
    router.register_handler(msg::PING,
        [this](SessionId s, const json& m) { return handle_ping(s, m); });
    router.register_handler(msg::GET_STATS,
        [this](SessionId s, const json& m) { return handle_stats(s, m); });
}

json StatusHandlers::handle_ping(SessionId, const json&) {
    auto now = std::chrono::system_clock::now().time_since_epoch();

    json reply;
    reply["type"] = msg::PONG;
    reply["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    return reply;
}

json StatusHandlers::handle_stats(SessionId, const json&) {
    json reply;
    reply["type"] = msg::STATS;
    reply["data"] = context_.store.stats().to_json();
    return reply;
}

} // namespace elrelay::relay
