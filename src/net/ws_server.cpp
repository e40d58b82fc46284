#include "net/ws_server.hpp"
#include "core/version.hpp"
#include "store/element.hpp"

#include <algorithm>
#include <stdexcept>
#include <boost/asio/dispatch.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

namespace elrelay::net {

namespace {

bool is_disconnect(const beast::error_code& ec) {
    return ec == websocket::error::closed ||
           ec == asio::error::operation_aborted ||
           ec == asio::error::eof ||
           ec == asio::error::connection_reset ||
           ec == beast::error::timeout;
}

} // namespace

// ---------------------------------------------------------------------------
// WsSession
// ---------------------------------------------------------------------------

WsSession::WsSession(tcp::socket&& socket, relay::SessionRegistry& sessions,
                     const relay::MessageRouter& router, size_t max_message_bytes)
    : ws_(std::move(socket)), sessions_(sessions), router_(router) {
    beast::error_code ec;
    auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    remote_ = ec ? std::string("unknown peer")
                 : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    ws_.read_message_max(max_message_bytes);
}

void WsSession::run() {
    // Start on the connection's strand
    asio::dispatch(ws_.get_executor(),
                   beast::bind_front_handler(&WsSession::on_run, shared_from_this()));
}

void WsSession::on_run() {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, std::string("elrelay/") + SERVER_VERSION);
    }));
    ws_.async_accept(beast::bind_front_handler(&WsSession::on_handshake, shared_from_this()));
}

void WsSession::on_handshake(beast::error_code ec) {
    if (ec) {
        spdlog::warn("WebSocket handshake with {} failed: {}", remote_, ec.message());
        return;
    }
    spdlog::info("Extension client connected: {}", remote_);
    id_ = sessions_.open(shared_from_this());
    do_read();
}

void WsSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::on_read, shared_from_this()));
}

void WsSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        return finish("read", ec);
    }

    if (!ws_.got_text()) {
        buffer_.consume(buffer_.size());
        enqueue(store::dump_json(relay::make_error_reply("binary frames are not supported")));
        return do_read();
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    auto reply = router_.handle_text(id_, text);
    enqueue(store::dump_json(reply));
    do_read();
}

bool WsSession::send(const nlohmann::json& message) {
    if (closed_) {
        return false;
    }
    asio::dispatch(ws_.get_executor(),
                   [self = shared_from_this(), text = store::dump_json(message)]() mutable {
                       self->enqueue(std::move(text));
                   });
    return true;
}

void WsSession::enqueue(std::string text) {
    if (closed_) {
        return;
    }
    outbox_.push_back(std::move(text));
    if (outbox_.size() == 1) {
        do_write();
    }
}

void WsSession::do_write() {
    ws_.text(true);
    ws_.async_write(asio::buffer(outbox_.front()),
                    beast::bind_front_handler(&WsSession::on_write, shared_from_this()));
}

void WsSession::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        return finish("write", ec);
    }
    outbox_.pop_front();
    if (!outbox_.empty()) {
        do_write();
    }
}

void WsSession::close() {
    asio::dispatch(ws_.get_executor(), [self = shared_from_this()]() {
        if (self->closed_.exchange(true)) {
            return;
        }
        if (self->id_ != 0) {
            self->sessions_.close(self->id_);
        }
        self->outbox_.clear();
        beast::get_lowest_layer(self->ws_).close();
    });
}

void WsSession::finish(const char* where, beast::error_code ec) {
    if (is_disconnect(ec)) {
        spdlog::info("Extension client disconnected: {}", remote_);
    } else {
        spdlog::warn("WebSocket {} error for {}: {}", where, remote_, ec.message());
    }

    closed_ = true;
    outbox_.clear();
    if (id_ != 0) {
        sessions_.close(id_);
    }
}

// ---------------------------------------------------------------------------
// WsServer
// ---------------------------------------------------------------------------

WsServer::WsServer(asio::io_context& ioc, relay::SessionRegistry& sessions,
                   const relay::MessageRouter& router, size_t max_message_bytes)
    : ioc_(ioc),
      acceptor_(ioc),
      sessions_(sessions),
      router_(router),
      max_message_bytes_(max_message_bytes) {}

WsServer::~WsServer() {
    beast::error_code ec;
    acceptor_.close(ec);
}

uint16_t WsServer::start(const std::string& host, uint16_t port,
                         const std::vector<uint16_t>& fallback_ports) {
    beast::error_code ec;
    auto address = asio::ip::make_address(host, ec);
    if (ec) {
        throw std::runtime_error("Invalid listen address '" + host + "': " + ec.message());
    }

    std::vector<uint16_t> candidates;
    candidates.push_back(port);
    candidates.insert(candidates.end(), fallback_ports.begin(), fallback_ports.end());

    for (uint16_t candidate : candidates) {
        if (try_bind(tcp::endpoint(address, candidate), ec)) {
            // Port 0 binds an ephemeral port; report the real one
            uint16_t bound = acceptor_.local_endpoint(ec).port();
            if (ec) bound = candidate;
            port_ = bound;
            listening_ = true;
            spdlog::info("WebSocket server listening on ws://{}:{}", host, bound);
            do_accept();
            return bound;
        }

        if (ec == asio::error::address_in_use) {
            spdlog::warn("Port {} in use, trying next...", candidate);
            continue;
        }
        throw std::runtime_error("Failed to listen on " + host + ":" +
                                 std::to_string(candidate) + ": " + ec.message());
    }

    throw std::runtime_error("All ports in use");
}

bool WsServer::try_bind(const tcp::endpoint& endpoint, beast::error_code& ec) {
    beast::error_code ignored;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) return false;

    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);

    if (ec) {
        acceptor_.close(ignored);
        return false;
    }
    return true;
}

void WsServer::stop() {
    bool was_listening = listening_.exchange(false);
    if (!was_listening && connections_.empty()) {
        return;
    }
    spdlog::info("Stopping WebSocket server...");

    beast::error_code ec;
    acceptor_.close(ec);

    for (auto& weak : connections_) {
        if (auto session = weak.lock()) {
            session->close();
        }
    }
    connections_.clear();
}

void WsServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(ioc_),
                           beast::bind_front_handler(&WsServer::on_accept, this));
}

void WsServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == asio::error::operation_aborted || !listening_) {
            return;
        }
        spdlog::warn("accept: {}", ec.message());
        return do_accept();
    }

    connections_.erase(
        std::remove_if(connections_.begin(), connections_.end(),
                       [](const std::weak_ptr<WsSession>& w) { return w.expired(); }),
        connections_.end());

    auto session = std::make_shared<WsSession>(std::move(socket), sessions_, router_, max_message_bytes_);
    connections_.push_back(session);
    session->run();

    do_accept();
}

} // namespace elrelay::net
