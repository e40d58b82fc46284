#undef NDEBUG
#include "relay/handlers.hpp"
#include "relay/message_router.hpp"
#include "relay/session_registry.hpp"
#include "store/element_store.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace elrelay;
using namespace elrelay::relay;
using json = nlohmann::json;

// Records everything it is sent
class RecordingChannel : public SessionChannel {
public:
    std::vector<json> received;
    bool accept = true;
    bool fail_hard = false;

    bool send(const json& message) override {
        if (fail_hard) {
            throw std::runtime_error("socket gone");
        }
        if (!accept) {
            return false;
        }
        received.push_back(message);
        return true;
    }

    size_t count_of(const std::string& type) const {
        size_t n = 0;
        for (const auto& m : received) {
            if (m.value("type", "") == type) n++;
        }
        return n;
    }
};

json captured_message(const std::string& id, int64_t timestamp = 1700000000000LL) {
    return {
        {"type", msg::ELEMENT_CAPTURED},
        {"element", {
            {"id", id},
            {"timestamp", timestamp},
            {"url", "https://example.com/app"},
            {"selector", "#" + id},
            {"html", "<span>x</span>"},
            {"text", "x"}
        }}
    };
}

store::StoreConfig quiet_store_config() {
    store::StoreConfig config;
    config.sweep_interval = std::chrono::milliseconds(0);
    return config;
}

void test_welcome_goes_to_opening_session_only() {
    std::cout << "Testing welcome delivery..." << std::endl;

    store::StoreConfig config = quiet_store_config();
    SessionRegistry registry(make_welcome(config));

    auto a = std::make_shared<RecordingChannel>();
    auto b = std::make_shared<RecordingChannel>();

    registry.open(a);
    assert(a->received.size() == 1);
    assert(a->received[0]["type"] == msg::WELCOME);
    assert(a->received[0]["data"]["maxElements"] == 50);
    assert(a->received[0]["data"]["ttl"] == 3600000);
    assert(a->received[0]["data"]["serverVersion"].is_string());

    registry.open(b);
    assert(a->received.size() == 1);
    assert(b->received.size() == 1);
    assert(b->received[0]["type"] == msg::WELCOME);

    std::cout << "  PASS" << std::endl;
}

void test_open_close_lifecycle() {
    std::cout << "Testing open/close..." << std::endl;

    SessionRegistry registry;
    auto a = std::make_shared<RecordingChannel>();
    auto b = std::make_shared<RecordingChannel>();

    SessionId id_a = registry.open(a);
    SessionId id_b = registry.open(b);
    assert(id_a != id_b);
    assert(id_a != 0 && id_b != 0);
    assert(registry.size() == 2);

    // No welcome configured
    assert(a->received.empty());

    assert(registry.close(id_a));
    assert(!registry.close(id_a));
    assert(!registry.contains(id_a));
    assert(registry.contains(id_b));

    // Sends to a closed session are dropped
    assert(!registry.send_to(id_a, {{"type", "PONG"}}));
    assert(a->received.empty());

    assert(registry.send_to(id_b, {{"type", "PONG"}}));
    assert(b->received.size() == 1);

    registry.close_all();
    assert(registry.size() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_broadcast_excludes_and_isolates() {
    std::cout << "Testing broadcast..." << std::endl;

    SessionRegistry registry;
    auto a = std::make_shared<RecordingChannel>();
    auto broken = std::make_shared<RecordingChannel>();
    auto refusing = std::make_shared<RecordingChannel>();
    auto c = std::make_shared<RecordingChannel>();
    broken->fail_hard = true;
    refusing->accept = false;

    SessionId id_a = registry.open(a);
    registry.open(broken);
    registry.open(refusing);
    registry.open(c);

    json note = {{"type", msg::ELEMENT_ADDED}};
    size_t delivered = registry.broadcast(note, id_a);
    assert(delivered == 1);
    assert(a->received.empty());
    assert(c->received.size() == 1);

    delivered = registry.broadcast(note);
    assert(delivered == 2);
    assert(a->received.size() == 1);
    assert(c->received.size() == 2);

    // Failing sessions stay registered until their transport closes them
    assert(registry.size() == 4);

    std::cout << "  PASS" << std::endl;
}

struct RelayFixture {
    store::ElementStore elements{quiet_store_config()};
    SessionRegistry sessions{make_welcome(elements.config())};
    MessageRouter router;
    HandlerContext context{elements, sessions};
    ElementHandlers element_handlers{context};
    StatusHandlers status_handlers{context};

    RelayFixture() {
        element_handlers.register_handlers(router);
        status_handlers.register_handlers(router);
    }
};

void test_capture_acks_sender_and_notifies_others() {
    std::cout << "Testing capture acknowledgement and broadcast..." << std::endl;

    RelayFixture fx;
    auto a = std::make_shared<RecordingChannel>();
    auto b = std::make_shared<RecordingChannel>();
    SessionId id_a = fx.sessions.open(a);
    fx.sessions.open(b);

    json reply = fx.router.handle(id_a, captured_message("el-1"));
    // The transport delivers the reply to the sender
    a->send(reply);

    assert(reply["type"] == msg::ELEMENT_STORED);
    assert(reply["data"]["id"] == "el-1");
    assert(reply["data"]["selector"] == "#el-1");
    assert(reply["data"]["timestamp"] == 1700000000000LL);
    assert(!reply["data"].contains("evictedId"));

    assert(a->count_of(msg::ELEMENT_STORED) == 1);
    assert(a->count_of(msg::ELEMENT_ADDED) == 0);
    assert(b->count_of(msg::ELEMENT_STORED) == 0);
    assert(b->count_of(msg::ELEMENT_ADDED) == 1);

    const json& note = b->received.back();
    assert(note["data"]["id"] == "el-1");
    assert(note["data"]["selector"] == "#el-1");
    assert(note["data"]["url"] == "https://example.com/app");

    assert(fx.elements.get("el-1"));

    std::cout << "  PASS" << std::endl;
}

void test_capture_reports_eviction() {
    std::cout << "Testing eviction in acknowledgement..." << std::endl;

    store::StoreConfig config = quiet_store_config();
    config.max_elements = 1;
    store::ElementStore elements(config);
    SessionRegistry sessions;
    MessageRouter router;
    HandlerContext context{elements, sessions};
    ElementHandlers handlers(context);
    handlers.register_handlers(router);

    router.handle(1, captured_message("first"));
    json reply = router.handle(1, captured_message("second"));
    assert(reply["type"] == msg::ELEMENT_STORED);
    assert(reply["data"]["evictedId"] == "first");

    std::cout << "  PASS" << std::endl;
}

void test_invalid_capture() {
    std::cout << "Testing invalid capture..." << std::endl;

    RelayFixture fx;
    auto a = std::make_shared<RecordingChannel>();
    auto b = std::make_shared<RecordingChannel>();
    SessionId id_a = fx.sessions.open(a);
    fx.sessions.open(b);

    json bad = captured_message("el-1");
    bad["element"]["url"] = "chrome://settings";
    json reply = fx.router.handle(id_a, bad);
    assert(reply["type"] == msg::ERROR);
    assert(reply["error"].get<std::string>().rfind("Invalid element: ", 0) == 0);

    reply = fx.router.handle(id_a, {{"type", msg::ELEMENT_CAPTURED}});
    assert(reply["type"] == msg::ERROR);

    // Nothing stored, nobody notified
    assert(fx.elements.stats().count == 0);
    assert(b->count_of(msg::ELEMENT_ADDED) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_router_errors_and_request_id() {
    std::cout << "Testing router errors..." << std::endl;

    RelayFixture fx;

    json reply = fx.router.handle(1, {{"type", "FROBNICATE"}, {"requestId", "r-7"}});
    assert(reply["type"] == msg::ERROR);
    assert(reply["error"] == "Unknown message type: FROBNICATE");
    assert(reply["requestId"] == "r-7");

    reply = fx.router.handle(1, {{"payload", 1}});
    assert(reply["type"] == msg::ERROR);

    reply = fx.router.handle(1, json::array({1, 2}));
    assert(reply["type"] == msg::ERROR);

    reply = fx.router.handle_text(1, "{not json");
    assert(reply["type"] == msg::ERROR);
    assert(reply["error"].get<std::string>().rfind("invalid JSON", 0) == 0);

    reply = fx.router.handle_text(1, R"({"type":"PING","requestId":42})");
    assert(reply["type"] == msg::PONG);
    assert(reply["requestId"] == 42);
    assert(reply["timestamp"].get<int64_t>() > 0);

    std::cout << "  PASS" << std::endl;
}

void test_handler_exception_becomes_error_reply() {
    std::cout << "Testing handler exceptions..." << std::endl;

    MessageRouter router;
    router.register_handler("BOOM", [](SessionId, const json&) -> json {
        throw std::runtime_error("kaboom");
    });

    json reply = router.handle(1, {{"type", "BOOM"}});
    assert(reply["type"] == msg::ERROR);
    assert(reply["error"] == "kaboom");

    std::cout << "  PASS" << std::endl;
}

void test_query_messages() {
    std::cout << "Testing list, stats, remove and clear messages..." << std::endl;

    RelayFixture fx;
    fx.router.handle(1, captured_message("a", 1000));
    fx.router.handle(1, captured_message("b", 2000));

    json reply = fx.router.handle(1, {{"type", msg::GET_ELEMENTS}});
    assert(reply["type"] == msg::ELEMENTS_LIST);
    assert(reply["elements"].size() == 2);
    assert(reply["elements"][0]["id"] == "b");
    assert(reply["elements"][1]["id"] == "a");

    reply = fx.router.handle(1, {{"type", msg::GET_STATS}});
    assert(reply["type"] == msg::STATS);
    assert(reply["data"]["total"] == 2);
    assert(reply["data"]["oldestTimestamp"] == 1000);
    assert(reply["data"]["newestTimestamp"] == 2000);

    reply = fx.router.handle(1, {{"type", msg::REMOVE_ELEMENT}, {"id", "a"}});
    assert(reply["type"] == msg::ELEMENT_REMOVED);
    assert(reply["removed"] == true);

    reply = fx.router.handle(1, {{"type", msg::REMOVE_ELEMENT}, {"id", "a"}});
    assert(reply["removed"] == false);

    reply = fx.router.handle(1, {{"type", msg::REMOVE_ELEMENT}});
    assert(reply["type"] == msg::ERROR);

    reply = fx.router.handle(1, {{"type", msg::CLEAR_ALL}});
    assert(reply["type"] == msg::ALL_CLEARED);
    assert(reply["count"] == 1);
    assert(fx.elements.list().empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Session Registry and Router Tests ===" << std::endl;

    test_welcome_goes_to_opening_session_only();
    test_open_close_lifecycle();
    test_broadcast_excludes_and_isolates();
    test_capture_acks_sender_and_notifies_others();
    test_capture_reports_eviction();
    test_invalid_capture();
    test_router_errors_and_request_id();
    test_handler_exception_becomes_error_reply();
    test_query_messages();

    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
