#pragma once
#include <nlohmann/json.hpp>
#include "relay/message_router.hpp"
#include "relay/module.hpp"
#include "relay/session_registry.hpp"
#include "store/element_store.hpp"

namespace elrelay::relay {

// Shared state the protocol handlers operate on
struct HandlerContext {
    store::ElementStore& store;
    SessionRegistry& sessions;
};

// WELCOME announcement carrying the store limits
nlohmann::json make_welcome(const store::StoreConfig& config);

// ELEMENT_CAPTURED, GET_ELEMENTS, REMOVE_ELEMENT, CLEAR_ALL
class ElementHandlers : public RelayModule {
public:
    explicit ElementHandlers(HandlerContext& context) : context_(context) {}
    void register_handlers(MessageRouter& router) override;

private:
    HandlerContext& context_;

    nlohmann::json handle_captured(SessionId session, const nlohmann::json& message);
    nlohmann::json handle_get_elements(SessionId session, const nlohmann::json& message);
    nlohmann::json handle_remove(SessionId session, const nlohmann::json& message);
    nlohmann::json handle_clear(SessionId session, const nlohmann::json& message);
};

// PING, GET_STATS
class StatusHandlers : public RelayModule {
public:
    explicit StatusHandlers(HandlerContext& context) : context_(context) {}
    void register_handlers(MessageRouter& router) override;

private:
    HandlerContext& context_;

    nlohmann::json handle_ping(SessionId session, const nlohmann::json& message);
    nlohmann::json handle_stats(SessionId session, const nlohmann::json& message);
};

} // namespace elrelay::relay
