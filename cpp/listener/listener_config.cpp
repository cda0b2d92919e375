#include "listener_config.hpp"

namespace stripe_listener {

namespace {

const char* LISTENER_SECTION = "listener";

std::chrono::milliseconds read_millis(const config::ProcessConfigManager& manager,
                                      const std::string& key,
                                      std::chrono::milliseconds default_value) {
    return std::chrono::milliseconds(
        manager.get_int(LISTENER_SECTION, key, static_cast<int>(default_value.count())));
}

} // namespace

void ListenerConfig::apply_defaults() {
    if (device_name.empty()) {
        device_name = "custom-stripe-listener";
    }
    if (websocket_features.empty()) {
        websocket_features.push_back("webhooks");
    }
    if (api_base.empty()) {
        api_base = DEFAULT_API_BASE;
    }
    while (!api_base.empty() && api_base.back() == '/') {
        api_base.pop_back();
    }
    if (pong_wait.count() <= 0) {
        pong_wait = std::chrono::milliseconds(10000);
    }
    if (ping_period.count() <= 0) {
        ping_period = pong_wait * 2 / 10;
    }
    if (write_wait.count() <= 0) {
        write_wait = std::chrono::milliseconds(1000);
    }
    if (handshake_timeout.count() <= 0) {
        handshake_timeout = std::chrono::milliseconds(10000);
    }
    if (http_timeout.count() <= 0) {
        http_timeout = std::chrono::milliseconds(30000);
    }
    if (close_grace.count() < 0) {
        close_grace = std::chrono::milliseconds(500);
    }
    if (proxy.empty()) {
        proxy = config::EnvironmentConfig::get_env_var("https_proxy");
        if (proxy.empty()) {
            proxy = config::EnvironmentConfig::get_env_var("HTTPS_PROXY");
        }
    }
}

std::vector<std::string> ListenerConfig::validate() const {
    std::vector<std::string> errors;

    if (api_key.empty()) {
        errors.push_back("api_key is required (set [listener] api_key or STRIPE_API_KEY)");
    }
    if (api_base.rfind("https://", 0) != 0 && api_base.rfind("http://", 0) != 0) {
        errors.push_back("api_base must be an http(s) URL: " + api_base);
    }
    if (ping_period >= pong_wait) {
        errors.push_back("ping_period_ms must be shorter than pong_wait_ms");
    }
    for (const auto& feature : websocket_features) {
        if (feature.empty()) {
            errors.push_back("websocket_features contains an empty entry");
        }
    }
    return errors;
}

ListenerConfig ListenerConfig::from_process_config(const config::ProcessConfigManager& manager) {
    ListenerConfig cfg;

    cfg.api_key = manager.get_string(LISTENER_SECTION, "api_key", "");
    if (cfg.api_key.empty()) {
        cfg.api_key = config::EnvironmentConfig::get_env_var("STRIPE_API_KEY");
    }
    cfg.device_name = manager.get_string(LISTENER_SECTION, "device_name", cfg.device_name);
    if (manager.has_key(LISTENER_SECTION, "websocket_features")) {
        cfg.websocket_features = manager.get_list(LISTENER_SECTION, "websocket_features");
    }
    cfg.api_base = manager.get_string(LISTENER_SECTION, "api_base", cfg.api_base);

    cfg.pong_wait = read_millis(manager, "pong_wait_ms", cfg.pong_wait);
    cfg.ping_period = read_millis(manager, "ping_period_ms", cfg.ping_period);
    cfg.write_wait = read_millis(manager, "write_wait_ms", cfg.write_wait);
    cfg.handshake_timeout = read_millis(manager, "handshake_timeout_ms", cfg.handshake_timeout);
    cfg.http_timeout = read_millis(manager, "http_timeout_ms", cfg.http_timeout);
    cfg.close_grace = read_millis(manager, "close_grace_ms", cfg.close_grace);

    cfg.verify_ssl = manager.get_bool(LISTENER_SECTION, "verify_ssl", cfg.verify_ssl);
    cfg.proxy = manager.get_string(LISTENER_SECTION, "proxy", "");

    cfg.apply_defaults();
    return cfg;
}

} // namespace stripe_listener
