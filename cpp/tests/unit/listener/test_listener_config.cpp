#include "doctest.h"
#include "../../../listener/listener_config.hpp"
#include <cstdlib>

using namespace stripe_listener;

TEST_CASE("ListenerConfig - Defaults") {
    ListenerConfig cfg;
    cfg.apply_defaults();

    CHECK(cfg.device_name == "custom-stripe-listener");
    REQUIRE(cfg.websocket_features.size() == 1);
    CHECK(cfg.websocket_features[0] == "webhooks");
    CHECK(cfg.api_base == "https://api.stripe.com");
    CHECK(cfg.pong_wait == std::chrono::seconds(10));
    CHECK(cfg.ping_period == std::chrono::seconds(2));
    CHECK(cfg.write_wait == std::chrono::seconds(1));
    CHECK(cfg.handshake_timeout == std::chrono::seconds(10));
    CHECK(cfg.http_timeout == std::chrono::seconds(30));
    CHECK(cfg.close_grace == std::chrono::milliseconds(500));
    CHECK(cfg.verify_ssl == true);
}

TEST_CASE("ListenerConfig - Derived Ping Period") {
    ListenerConfig cfg;
    cfg.pong_wait = std::chrono::milliseconds(5000);
    cfg.apply_defaults();
    CHECK(cfg.ping_period == std::chrono::milliseconds(1000));

    ListenerConfig explicit_cfg;
    explicit_cfg.ping_period = std::chrono::milliseconds(700);
    explicit_cfg.apply_defaults();
    CHECK(explicit_cfg.ping_period == std::chrono::milliseconds(700));
}

TEST_CASE("ListenerConfig - Empty Values Are Replaced") {
    ListenerConfig cfg;
    cfg.device_name = "";
    cfg.websocket_features.clear();
    cfg.api_base = "https://api.example.test/";
    cfg.write_wait = std::chrono::milliseconds(-5);
    cfg.close_grace = std::chrono::milliseconds(0);
    cfg.apply_defaults();

    CHECK(cfg.device_name == "custom-stripe-listener");
    CHECK(cfg.websocket_features == std::vector<std::string>{"webhooks"});
    CHECK(cfg.api_base == "https://api.example.test");
    CHECK(cfg.write_wait == std::chrono::seconds(1));
    CHECK(cfg.close_grace == std::chrono::milliseconds(0));
}

TEST_CASE("ListenerConfig - Validation") {
    ListenerConfig cfg;
    cfg.apply_defaults();

    auto errors = cfg.validate();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("api_key") != std::string::npos);

    cfg.api_key = "sk_test_123";
    CHECK(cfg.validate().empty());

    cfg.ping_period = cfg.pong_wait;
    CHECK(cfg.validate().size() == 1);

    cfg.ping_period = std::chrono::seconds(2);
    cfg.api_base = "ftp://api.stripe.com";
    CHECK(cfg.validate().size() == 1);
}

TEST_CASE("ListenerConfig - From Process Config") {
    config::ProcessConfigManager manager;
    manager.load_config_from_string(
        "[listener]\n"
        "api_key = sk_test_file\n"
        "device_name = build-agent\n"
        "websocket_features = webhooks, v2_events\n"
        "api_base = http://localhost:12111\n"
        "pong_wait_ms = 4000\n"
        "write_wait_ms = 250\n"
        "close_grace_ms = 100\n"
        "verify_ssl = false\n"
        "proxy = http://proxy.local:3128\n");

    ListenerConfig cfg = ListenerConfig::from_process_config(manager);

    CHECK(cfg.api_key == "sk_test_file");
    CHECK(cfg.device_name == "build-agent");
    CHECK(cfg.websocket_features == std::vector<std::string>{"webhooks", "v2_events"});
    CHECK(cfg.api_base == "http://localhost:12111");
    CHECK(cfg.pong_wait == std::chrono::milliseconds(4000));
    CHECK(cfg.ping_period == std::chrono::milliseconds(800));
    CHECK(cfg.write_wait == std::chrono::milliseconds(250));
    CHECK(cfg.close_grace == std::chrono::milliseconds(100));
    CHECK(cfg.verify_ssl == false);
    CHECK(cfg.proxy == "http://proxy.local:3128");
    CHECK(cfg.validate().empty());
}

TEST_CASE("ListenerConfig - Api Key From Environment") {
    setenv("STRIPE_API_KEY", "sk_test_from_env", 1);

    config::ProcessConfigManager manager;
    manager.load_config_from_string("[listener]\ndevice_name = env-test\n");
    ListenerConfig cfg = ListenerConfig::from_process_config(manager);

    CHECK(cfg.api_key == "sk_test_from_env");
    CHECK(cfg.websocket_features == std::vector<std::string>{"webhooks"});

    unsetenv("STRIPE_API_KEY");
}

TEST_CASE("ListenerConfig - Proxy From Environment") {
    setenv("https_proxy", "http://env-proxy:8080", 1);

    ListenerConfig cfg;
    cfg.apply_defaults();
    CHECK(cfg.proxy == "http://env-proxy:8080");

    unsetenv("https_proxy");
}
