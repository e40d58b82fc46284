#include "relay/session_registry.hpp"
#include <vector>
#include <spdlog/spdlog.h>

namespace elrelay::relay {

SessionRegistry::SessionRegistry(nlohmann::json welcome)
    : welcome_(std::move(welcome)) {}

SessionId SessionRegistry::open(std::shared_ptr<SessionChannel> channel) {
    SessionId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        sessions_[id] = channel;
    }
    spdlog::info("Session {} opened ({})", id, channel->describe());

    if (!welcome_.is_null()) {
        deliver(id, *channel, welcome_);
    }
    return id;
}

bool SessionRegistry::close(SessionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = sessions_.erase(id) > 0;
    if (removed) {
        spdlog::info("Session {} closed", id);
    }
    return removed;
}

void SessionRegistry::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.empty()) {
        spdlog::info("Dropping {} session(s)", sessions_.size());
    }
    sessions_.clear();
}

bool SessionRegistry::send_to(SessionId id, const nlohmann::json& message) {
    std::shared_ptr<SessionChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            spdlog::debug("Dropping message for closed session {}", id);
            return false;
        }
        channel = it->second;
    }
    return deliver(id, *channel, message);
}

size_t SessionRegistry::broadcast(const nlohmann::json& message, std::optional<SessionId> exclude) {
    std::vector<std::pair<SessionId, std::shared_ptr<SessionChannel>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, channel] : sessions_) {
            if (exclude && *exclude == id) continue;
            targets.emplace_back(id, channel);
        }
    }

    size_t delivered = 0;
    for (auto& [id, channel] : targets) {
        if (deliver(id, *channel, message)) {
            delivered++;
        }
    }
    return delivered;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionRegistry::contains(SessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(id) > 0;
}

bool SessionRegistry::deliver(SessionId id, SessionChannel& channel, const nlohmann::json& message) {
    try {
        if (channel.send(message)) {
            return true;
        }
        spdlog::warn("Session {} did not accept {}", id, message.value("type", "message"));
    } catch (const std::exception& e) {
        spdlog::warn("Send to session {} failed: {}", id, e.what());
    }
    return false;
}

} // namespace elrelay::relay
