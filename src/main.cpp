// elrelay - element context relay
//
// Receives captured page elements from the browser extension over WebSocket
// and serves them to an MCP client over stdio.
//
// Configuration comes from ELRELAY_* environment variables or a .env file;
// see relay/config.hpp for the full list.

#include <csignal>
#include <iostream>
#include <thread>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/version.hpp"
#include "mcp/server.hpp"
#include "net/ws_server.hpp"
#include "query/query_facade.hpp"
#include "relay/config.hpp"
#include "relay/handlers.hpp"
#include "relay/message_router.hpp"
#include "relay/session_registry.hpp"
#include "store/element_store.hpp"

using namespace elrelay;

int main() {
    core::init_logger();
    core::config::load_dotenv();

    auto config = relay::RelayConfig::from_env();
    core::set_log_level(core::parse_log_level(config.log_level));

    spdlog::info("Element Context Capture MCP Server v{}", SERVER_VERSION);
    spdlog::info("  Max elements: {}", config.store.max_elements);
    spdlog::info("  TTL: {}s", config.store.ttl.count() / 1000);

    store::ElementStore store(config.store);
    relay::SessionRegistry sessions(relay::make_welcome(config.store));

    relay::MessageRouter router;
    relay::HandlerContext context{store, sessions};
    relay::ElementHandlers element_handlers(context);
    relay::StatusHandlers status_handlers(context);
    element_handlers.register_handlers(router);
    status_handlers.register_handlers(router);

    boost::asio::io_context ioc{1};
    net::WsServer ws_server(ioc, sessions, router, config.max_message_bytes);

    uint16_t port = 0;
    try {
        port = ws_server.start(config.ws_host, config.ws_port, config.ws_fallback_ports);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to start server: {}", e.what());
        store.teardown();
        return 1;
    }

    query::QueryFacade facade(store, [&ws_server, &sessions]() {
        query::ChannelStatus status;
        status.running = ws_server.listening();
        status.port = ws_server.port();
        status.clients = sessions.size();
        return status;
    });
    mcp::Server mcp_server(facade, config.max_message_bytes);

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&mcp_server](const boost::system::error_code& ec, int signal) {
        if (ec) return;
        spdlog::info("Signal {} received, shutting down gracefully", signal);
        mcp_server.stop();
    });

    std::thread io_thread([&ioc]() {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            spdlog::error("WebSocket event loop failed: {}", e.what());
        }
    });

    spdlog::info("Server ready! Extension should connect to ws://{}:{}", config.ws_host, port);
    mcp_server.run(STDIN_FILENO, std::cout);

    // Shutdown: listener and connections on the io thread, then the rest
    boost::asio::post(ioc, [&ws_server, &signals]() {
        ws_server.stop();
        boost::system::error_code ignored;
        signals.cancel(ignored);
    });
    sessions.close_all();
    store.teardown();
    io_thread.join();

    spdlog::info("Shutdown complete");
    return 0;
}
