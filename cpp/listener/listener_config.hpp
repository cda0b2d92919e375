#pragma once
#include <string>
#include <vector>
#include <chrono>
#include "client_identity.hpp"
#include "../utils/config/process_config_manager.hpp"

namespace stripe_listener {

struct ListenerConfig {
    std::string api_key;
    std::string device_name{"custom-stripe-listener"};
    std::vector<std::string> websocket_features{"webhooks"};
    std::string api_base{DEFAULT_API_BASE};

    std::chrono::milliseconds pong_wait{10000};
    std::chrono::milliseconds ping_period{0};        // 0 derives pong_wait * 2 / 10
    std::chrono::milliseconds write_wait{1000};
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds http_timeout{30000};
    std::chrono::milliseconds close_grace{500};

    bool verify_ssl{true};
    std::string proxy;                               // empty falls back to https_proxy

    // Replace unset or non-positive values with the defaults
    void apply_defaults();

    // Empty when the configuration is usable
    std::vector<std::string> validate() const;

    /**
     * Read the [listener] section. The api key falls back to STRIPE_API_KEY
     * when the key is absent. The result has defaults applied.
     */
    static ListenerConfig from_process_config(const config::ProcessConfigManager& manager);
};

} // namespace stripe_listener
