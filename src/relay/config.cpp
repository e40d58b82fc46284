#include "relay/config.hpp"
#include "core/config.hpp"
#include <chrono>
#include <limits>

namespace elrelay::relay {

namespace cfg = core::config;

RelayConfig RelayConfig::from_env() {
    RelayConfig config;
    constexpr int64_t kMaxInt = std::numeric_limits<int32_t>::max();

    auto& store = config.store;
    store.max_elements = static_cast<size_t>(
        cfg::get_env_int("ELRELAY_MAX_ELEMENTS", static_cast<int64_t>(store.max_elements), 1, 100000));
    store.ttl = std::chrono::milliseconds(
        cfg::get_env_int("ELRELAY_TTL_MS", store.ttl.count(), 1, kMaxInt));
    store.sweep_interval = std::chrono::milliseconds(
        cfg::get_env_int("ELRELAY_SWEEP_INTERVAL_MS", store.sweep_interval.count(), 0, kMaxInt));

    auto& limits = store.limits;
    limits.max_body_bytes = static_cast<size_t>(
        cfg::get_env_int("ELRELAY_MAX_HTML_BYTES", static_cast<int64_t>(limits.max_body_bytes), 1, kMaxInt));
    limits.max_excerpt_bytes = static_cast<size_t>(
        cfg::get_env_int("ELRELAY_MAX_TEXT_BYTES", static_cast<int64_t>(limits.max_excerpt_bytes), 1, kMaxInt));
    limits.max_media_bytes = static_cast<size_t>(
        cfg::get_env_int("ELRELAY_MAX_SCREENSHOT_BYTES", static_cast<int64_t>(limits.max_media_bytes), 0, kMaxInt));

    config.ws_host = cfg::get_env_or("ELRELAY_WS_HOST", config.ws_host);
    config.ws_port = static_cast<uint16_t>(
        cfg::get_env_int("ELRELAY_WS_PORT", config.ws_port, 1, 65535));
    config.ws_fallback_ports = cfg::get_env_ports("ELRELAY_WS_FALLBACK_PORTS", config.ws_fallback_ports);
    config.max_message_bytes = static_cast<size_t>(
        cfg::get_env_int("ELRELAY_MAX_MESSAGE_BYTES", static_cast<int64_t>(config.max_message_bytes), 1024, kMaxInt));

    config.log_level = cfg::get_env_or("ELRELAY_LOG_LEVEL", config.log_level);
    return config;
}

} // namespace elrelay::relay
