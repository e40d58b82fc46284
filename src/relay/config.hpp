#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "store/element_store.hpp"

namespace elrelay::relay {

// Relay configuration, fixed at start-up
struct RelayConfig {
    store::StoreConfig store;

    // Producer-facing WebSocket listener
    std::string ws_host = "127.0.0.1";
    uint16_t ws_port = 38100;
    std::vector<uint16_t> ws_fallback_ports = {38101, 38102, 38103};
    size_t max_message_bytes = 4 * 1024 * 1024;

    std::string log_level = "info";

    // Read ELRELAY_* variables (after load_dotenv); bad values keep defaults
    static RelayConfig from_env();
};

} // namespace elrelay::relay
