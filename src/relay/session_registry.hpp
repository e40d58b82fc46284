#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

namespace elrelay::relay {

using SessionId = uint64_t;

// One open bidirectional channel to a producer or consumer.
// send() returns false (or throws) when the message could not be queued.
class SessionChannel {
public:
    virtual ~SessionChannel() = default;
    virtual bool send(const nlohmann::json& message) = 0;
    virtual std::string describe() const { return "session"; }
};

// Table of live sessions keyed by an opaque handle.
//
// Sessions exist only for the lifetime of their connection. Sends to a
// closed session are dropped. Broadcast delivers to every session but the
// excluded one; a failing session is logged and skipped.
class SessionRegistry {
public:
    // welcome is pushed to each session as it opens
    explicit SessionRegistry(nlohmann::json welcome = nlohmann::json());

    SessionId open(std::shared_ptr<SessionChannel> channel);
    bool close(SessionId id);
    void close_all();

    bool send_to(SessionId id, const nlohmann::json& message);
    size_t broadcast(const nlohmann::json& message, std::optional<SessionId> exclude = std::nullopt);

    size_t size() const;
    bool contains(SessionId id) const;

private:
    nlohmann::json welcome_;
    std::map<SessionId, std::shared_ptr<SessionChannel>> sessions_;
    SessionId next_id_ = 1;
    mutable std::mutex mutex_;

    static bool deliver(SessionId id, SessionChannel& channel, const nlohmann::json& message);
};

} // namespace elrelay::relay
