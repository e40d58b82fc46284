/**
 * Producer-facing WebSocket server
 *
 * Accepts connections from the capture extension on a loopback port, one
 * relay session per connection. All socket work runs on the io_context the
 * server is given; run that context on a single thread so inbound messages
 * are handled one at a time.
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "relay/message_router.hpp"
#include "relay/session_registry.hpp"

namespace elrelay::net {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class WsSession;

class WsServer {
public:
    WsServer(asio::io_context& ioc, relay::SessionRegistry& sessions,
             const relay::MessageRouter& router, size_t max_message_bytes);
    ~WsServer();

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    // Bind host:port, or the first free fallback port, and start accepting.
    // Returns the bound port; throws std::runtime_error if no port is usable.
    uint16_t start(const std::string& host, uint16_t port,
                   const std::vector<uint16_t>& fallback_ports);

    // Close the listener and every open connection. Run on the io_context
    // thread (or after it has stopped).
    void stop();

    bool listening() const { return listening_; }
    uint16_t port() const { return port_; }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    relay::SessionRegistry& sessions_;
    const relay::MessageRouter& router_;
    size_t max_message_bytes_;

    std::atomic<bool> listening_{false};
    std::atomic<uint16_t> port_{0};

    // Touched only on the io_context thread
    std::vector<std::weak_ptr<WsSession>> connections_;

    bool try_bind(const tcp::endpoint& endpoint, beast::error_code& ec);
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
};

// One WebSocket connection registered as a relay session
class WsSession : public relay::SessionChannel,
                  public std::enable_shared_from_this<WsSession> {
public:
    WsSession(tcp::socket&& socket, relay::SessionRegistry& sessions,
              const relay::MessageRouter& router, size_t max_message_bytes);

    void run();

    // Queue a message for writing; safe from any thread
    bool send(const nlohmann::json& message) override;
    std::string describe() const override { return remote_; }

    // Drop the connection without a close handshake
    void close();

private:
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    relay::SessionRegistry& sessions_;
    const relay::MessageRouter& router_;
    relay::SessionId id_ = 0;
    std::atomic<bool> closed_{false};
    std::string remote_;

    void on_run();
    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void enqueue(std::string text);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);
    void finish(const char* where, beast::error_code ec);
};

} // namespace elrelay::net
