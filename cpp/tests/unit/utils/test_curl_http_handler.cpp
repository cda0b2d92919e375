#include "doctest.h"
#include "../../../utils/http/curl_http_handler.hpp"

TEST_CASE("CurlHttpHandler - Form Encoding") {
    CurlHttpHandler handler;
    REQUIRE(handler.initialize());

    std::string body = handler.encode_form({
        {"device_name", "my laptop"},
        {"websocket_features[]", "webhooks"},
        {"websocket_features[]", "v2_events"},
    });

    CHECK(body == "device_name=my%20laptop&websocket_features%5B%5D=webhooks&websocket_features%5B%5D=v2_events");
    CHECK(handler.encode_form({}).empty());
}

TEST_CASE("CurlHttpHandler - Lifecycle") {
    auto handler = HttpHandlerFactory::create();
    REQUIRE(handler != nullptr);
    CHECK_FALSE(handler->is_initialized());

    CHECK(handler->initialize());
    CHECK(handler->is_initialized());

    handler->shutdown();
    CHECK_FALSE(handler->is_initialized());

    // Requests after shutdown fail without touching the network
    HttpRequest request;
    request.method = "POST";
    request.url = "https://api.stripe.com/v1/stripecli/sessions";
    HttpResponse response = handler->make_request(request);
    CHECK(response.status_code == 0);
    CHECK_FALSE(response.success);
    CHECK(response.error_message == "HTTP handler not initialized");
}

TEST_CASE("CurlHttpHandler - Unreachable Host") {
    CurlHttpHandler handler;
    REQUIRE(handler.initialize());

    HttpRequest request;
    request.method = "POST";
    request.url = "http://127.0.0.1:1/v1/stripecli/sessions";
    request.form_fields.emplace_back("device_name", "unit-test");
    request.timeout_ms = 2000;

    HttpResponse response = handler.make_request(request);
    CHECK(response.status_code == 0);
    CHECK_FALSE(response.success);
    CHECK(response.error_message.find("CURL error") == 0);
}
