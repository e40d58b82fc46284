#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "relay/session_registry.hpp"

namespace elrelay::relay {

// Producer protocol message types
namespace msg {
    // inbound
    constexpr const char* ELEMENT_CAPTURED = "ELEMENT_CAPTURED";
    constexpr const char* PING = "PING";
    constexpr const char* GET_STATS = "GET_STATS";
    constexpr const char* GET_ELEMENTS = "GET_ELEMENTS";
    constexpr const char* REMOVE_ELEMENT = "REMOVE_ELEMENT";
    constexpr const char* CLEAR_ALL = "CLEAR_ALL";
    // outbound
    constexpr const char* WELCOME = "WELCOME";
    constexpr const char* ELEMENT_STORED = "ELEMENT_STORED";
    constexpr const char* ELEMENT_ADDED = "ELEMENT_ADDED";
    constexpr const char* PONG = "PONG";
    constexpr const char* STATS = "STATS";
    constexpr const char* ELEMENTS_LIST = "ELEMENTS_LIST";
    constexpr const char* ELEMENT_REMOVED = "ELEMENT_REMOVED";
    constexpr const char* ALL_CLEARED = "ALL_CLEARED";
    constexpr const char* ERROR = "ERROR";
}

nlohmann::json make_error_reply(const std::string& error);

// Dispatch table from message type to handler.
// Every inbound message gets exactly one reply; unknown types and malformed
// envelopes are answered with an ERROR reply.
class MessageRouter {
public:
    using Handler = std::function<nlohmann::json(SessionId, const nlohmann::json&)>;

    MessageRouter() = default;

    nlohmann::json handle(SessionId session, const nlohmann::json& message) const;
    nlohmann::json handle_text(SessionId session, const std::string& text) const;
    void register_handler(const std::string& type, Handler handler);

private:
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace elrelay::relay
