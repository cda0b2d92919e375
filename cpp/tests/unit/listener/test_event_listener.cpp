#include "doctest.h"
#include "../../../listener/event_listener.hpp"
#include "../../mocks/mock_event_handler.hpp"
#include "../../mocks/mock_http_handler.hpp"
#include "../../mocks/mock_logger.hpp"
#include "../../mocks/mock_websocket_transport.hpp"
#include <json/json.h>
#include <thread>

using namespace stripe_listener;
using error_handling::ErrorCode;
using error_handling::Status;
using test_utils::CapturingLogger;
using test_utils::MockWebSocketTransport;
using test_utils::RecordingEventHandler;
using test_utils::TestWebSocketTransportFactory;

namespace {

const char* LISTENER_SESSION_BODY = R"({
    "reconnect_delay": 5,
    "secret": "whsec_test",
    "websocket_authorized_feature": "webhooks",
    "websocket_id": "ws_1",
    "websocket_url": "wss://stripe-cli.stripe.com/subscribe/acct_123",
    "default_version": "2020-08-27",
    "latest_version": "2024-06-20"
})";

ListenerConfig listener_test_config() {
    ListenerConfig cfg;
    cfg.api_key = "sk_test_123";
    cfg.pong_wait = std::chrono::milliseconds(5000);
    cfg.ping_period = std::chrono::milliseconds(1000);
    cfg.close_grace = std::chrono::milliseconds(10);
    return cfg;
}

// Wires an EventListener to in-memory collaborators
struct ListenerFixture {
    std::shared_ptr<MockHttpHandler> http = std::make_shared<MockHttpHandler>();
    std::shared_ptr<RecordingEventHandler> handler = std::make_shared<RecordingEventHandler>();
    std::shared_ptr<CapturingLogger> logger = std::make_shared<CapturingLogger>();
    MockWebSocketTransport* mock{nullptr};
    std::unique_ptr<EventListener> listener;

    explicit ListenerFixture(ListenerConfig cfg = listener_test_config()) {
        http->set_response(200, LISTENER_SESSION_BODY);
        auto transport = std::make_unique<MockWebSocketTransport>();
        mock = transport.get();
        handler->ack_probe = [this]() { return mock->get_sent_texts().size(); };
        listener = std::make_unique<EventListener>(cfg, handler, logger, http,
                                                   TestWebSocketTransportFactory::single_use(std::move(transport)));
    }
};

// Runs listen_all() on a background thread
class ListenRunner {
public:
    ListenRunner(EventListener& listener, CancellationToken token)
        : token_(token),
          thread_([this, &listener]() {
              status_ = listener.listen_all(token_);
              done_ = true;
          }) {}

    // A failed REQUIRE must not leave the listener running
    ~ListenRunner() {
        if (thread_.joinable()) {
            token_.cancel();
            thread_.join();
        }
    }

    Status join() {
        thread_.join();
        return status_;
    }

    bool done() const { return done_.load(); }

private:
    CancellationToken token_;
    Status status_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

Json::Value parse_sent_frame(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    reader->parse(text.data(), text.data() + text.size(), &root, &errors);
    return root;
}

} // namespace

TEST_CASE("EventListener - Requires Handler") {
    CHECK_THROWS_AS(EventListener(listener_test_config(), nullptr, std::make_shared<CapturingLogger>(),
                                  std::make_shared<MockHttpHandler>(),
                                  TestWebSocketTransportFactory::single_use(nullptr)),
                    std::invalid_argument);
}

TEST_CASE("EventListener - Preconditions") {
    ListenerFixture fixture;
    EventListener& listener = *fixture.listener;
    CancellationToken token;

    CHECK(listener.get_state() == ListenerState::CREATED);
    CHECK_FALSE(listener.session().has_value());

    Status status = listener.listen(token);
    CHECK(status.code() == ErrorCode::PRECONDITION_FAILED);
    CHECK(status.message() == "call connect before listen");

    status = listener.connect();
    CHECK(status.code() == ErrorCode::PRECONDITION_FAILED);
    CHECK(status.message() == "call authorize before connect");

    REQUIRE(listener.authorize().is_success());
    CHECK(listener.get_state() == ListenerState::AUTHORIZED);
    REQUIRE(listener.session().has_value());
    CHECK(listener.session()->websocket_id == "ws_1");

    REQUIRE(listener.connect().is_success());
    CHECK(listener.get_state() == ListenerState::CONNECTED);
}

TEST_CASE("EventListener - Config Defaults Applied") {
    ListenerConfig cfg;
    cfg.api_key = "sk_test_123";
    cfg.pong_wait = std::chrono::milliseconds(3000);

    EventListener listener(cfg, std::make_shared<RecordingEventHandler>(), std::make_shared<CapturingLogger>(),
                           std::make_shared<MockHttpHandler>(),
                           TestWebSocketTransportFactory::single_use(nullptr));
    CHECK(listener.config().ping_period == std::chrono::milliseconds(600));
    CHECK(listener.config().device_name == "custom-stripe-listener");
}

TEST_CASE("EventListener - Webhook Event End To End") {
    ListenerFixture fixture;
    CancellationToken token;
    ListenRunner runner(*fixture.listener, token);

    fixture.mock->push_text(
        R"({"type":"webhook_event","endpoint":{"api_version":null},)"
        R"("event_payload":"{\"id\":\"evt_1\",\"type\":\"charge.succeeded\"}",)"
        R"("http_headers":{"Stripe-Signature":"t=1,v1=abc"},"webhook_conversation_id":"wc_1","webhook_id":"wh_1"})");

    REQUIRE(fixture.handler->wait_for_calls(1, std::chrono::seconds(5)));

    // Authorization request
    auto requests = fixture.http->get_requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].url == "https://api.stripe.com/v1/stripecli/sessions");

    // Dial
    auto options = fixture.mock->get_dial_options();
    CHECK(options.url == "wss://stripe-cli.stripe.com/subscribe/acct_123?websocket_feature=webhooks");
    CHECK(options.headers.at("Websocket-Id") == "ws_1");

    // Exactly one ack, written before the callback
    auto sent = fixture.mock->get_sent_texts();
    REQUIRE(sent.size() == 1);
    Json::Value ack = parse_sent_frame(sent[0]);
    CHECK(ack["type"].asString() == "event_ack");
    CHECK(ack["event_id"].asString() == "evt_1");
    CHECK(ack["webhook_conversation_id"].asString() == "wc_1");
    CHECK(ack["webhook_id"].asString() == "wh_1");

    auto calls = fixture.handler->get_calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].kind == "webhook");
    CHECK(calls[0].acks_before == 1);
    CHECK(calls[0].webhook_payload.type == "charge.succeeded");
    CHECK(fixture.listener->get_state() == ListenerState::LISTENING);

    token.cancel();
    Status status = runner.join();
    CHECK(status.code() == ErrorCode::CANCELLED);
    CHECK(fixture.listener->get_state() == ListenerState::CLOSED);
}

TEST_CASE("EventListener - Unrecognized Frame End To End") {
    ListenerFixture fixture;
    CancellationToken token;
    ListenRunner runner(*fixture.listener, token);

    fixture.mock->push_text(R"({"type":"ping_custom"})");
    REQUIRE(fixture.handler->wait_for_calls(1, std::chrono::seconds(5)));

    auto calls = fixture.handler->get_calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].kind == "unknown");
    CHECK(calls[0].raw_type == "ping_custom");
    CHECK(fixture.mock->get_sent_texts().empty());

    token.cancel();
    CHECK(runner.join().code() == ErrorCode::CANCELLED);
    CHECK(fixture.mock->get_sent_texts().empty());
}

TEST_CASE("EventListener - Cancellation Closes Gracefully") {
    ListenerConfig cfg = listener_test_config();
    cfg.pong_wait = std::chrono::milliseconds(10000);
    cfg.ping_period = std::chrono::milliseconds(2000);
    cfg.close_grace = std::chrono::milliseconds(500);
    ListenerFixture fixture(cfg);

    CancellationToken token;
    ListenRunner runner(*fixture.listener, token);

    fixture.mock->push_text(R"({"type":"hello"})");
    REQUIRE(fixture.handler->wait_for_calls(1, std::chrono::seconds(5)));

    auto cancelled_at = std::chrono::steady_clock::now();
    token.cancel();
    Status status = runner.join();
    auto elapsed = std::chrono::steady_clock::now() - cancelled_at;

    CHECK(status.code() == ErrorCode::CANCELLED);
    CHECK(elapsed >= std::chrono::milliseconds(500));
    CHECK(elapsed < std::chrono::milliseconds(2000));

    auto closes = fixture.mock->get_sent_closes();
    REQUIRE(closes.size() == 1);
    CHECK(closes[0].first == 1000);
    CHECK(closes[0].second == "done");
    CHECK(fixture.mock->disconnect_count() >= 1);
    CHECK_FALSE(fixture.mock->is_connected());
}

TEST_CASE("EventListener - Normal Close From Peer") {
    ListenerFixture fixture;
    CancellationToken token;
    ListenRunner runner(*fixture.listener, token);

    fixture.mock->push_text(R"({"type":"hello"})");
    fixture.mock->push_close(websocket_transport::CLOSE_NORMAL, "bye");

    Status status = runner.join();
    CHECK(status.is_success());
    CHECK(fixture.handler->get_calls().size() == 1);
    CHECK(fixture.mock->disconnect_count() >= 1);
}

TEST_CASE("EventListener - Abnormal Close From Peer") {
    ListenerFixture fixture;
    CancellationToken token;
    ListenRunner runner(*fixture.listener, token);

    fixture.mock->push_close(1011, "internal error");

    Status status = runner.join();
    CHECK(status.code() == ErrorCode::READ_FAILED);
    CHECK(status.message().find("read: ") == 0);
    CHECK(status.message().find("1011") != std::string::npos);
}

TEST_CASE("EventListener - Transport Read Error") {
    ListenerFixture fixture;
    CancellationToken token;
    ListenRunner runner(*fixture.listener, token);

    fixture.mock->push_error("connection reset by peer");

    Status status = runner.join();
    CHECK(status.code() == ErrorCode::READ_FAILED);
    CHECK(status.message() == "read: connection reset by peer");
}

TEST_CASE("EventListener - Read Deadline Expires") {
    ListenerConfig cfg = listener_test_config();
    cfg.pong_wait = std::chrono::milliseconds(150);
    cfg.ping_period = std::chrono::milliseconds(10000);
    ListenerFixture fixture(cfg);

    CancellationToken token;
    auto start = std::chrono::steady_clock::now();
    ListenRunner runner(*fixture.listener, token);

    Status status = runner.join();
    CHECK(status.code() == ErrorCode::READ_FAILED);
    CHECK(status.message() == "read: i/o timeout");
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(150));
}

TEST_CASE("EventListener - Pong Extends Read Deadline") {
    ListenerConfig cfg = listener_test_config();
    cfg.pong_wait = std::chrono::milliseconds(300);
    cfg.ping_period = std::chrono::milliseconds(10000);
    ListenerFixture fixture(cfg);

    CancellationToken token;
    auto start = std::chrono::steady_clock::now();
    ListenRunner runner(*fixture.listener, token);

    // Keep the connection alive for well over one pong_wait
    for (int i = 0; i < 12; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        fixture.mock->simulate_pong();
    }
    CHECK_FALSE(runner.done());

    Status status = runner.join();
    CHECK(status.code() == ErrorCode::READ_FAILED);
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(900));
}

TEST_CASE("EventListener - Keepalive Pings") {
    ListenerConfig cfg = listener_test_config();
    cfg.ping_period = std::chrono::milliseconds(20);
    ListenerFixture fixture(cfg);

    CancellationToken token;
    ListenRunner runner(*fixture.listener, token);

    CHECK(fixture.mock->wait_for_pings(3, std::chrono::seconds(5)));

    // Reads keep flowing while pings are written
    fixture.mock->push_text(R"({"type":"hello"})");
    CHECK(fixture.handler->wait_for_calls(1, std::chrono::seconds(5)));

    token.cancel();
    CHECK(runner.join().code() == ErrorCode::CANCELLED);
}

TEST_CASE("EventListener - Ping Failure Ends Listen") {
    ListenerConfig cfg = listener_test_config();
    cfg.ping_period = std::chrono::milliseconds(20);
    ListenerFixture fixture(cfg);
    fixture.mock->fail_pings(true);

    CancellationToken token;
    ListenRunner runner(*fixture.listener, token);

    Status status = runner.join();
    CHECK(status.code() == ErrorCode::WRITE_FAILED);
    CHECK(status.message() == "ping: broken pipe");
    CHECK(fixture.mock->get_sent_closes().size() == 1);
    CHECK(fixture.mock->disconnect_count() >= 1);
}

TEST_CASE("EventListener - Ack Failure Keeps Reading") {
    ListenerFixture fixture;
    fixture.mock->fail_text_sends(true);

    CancellationToken token;
    ListenRunner runner(*fixture.listener, token);

    const std::string frame =
        R"({"type":"webhook_event","event_payload":"{\"id\":\"evt_1\"}","webhook_id":"wh_1"})";
    fixture.mock->push_text(frame);
    fixture.mock->push_text(frame);

    REQUIRE(fixture.handler->wait_for_calls(2, std::chrono::seconds(5)));
    CHECK_FALSE(runner.done());
    CHECK(fixture.listener->get_statistics().ack_failures == 2);
    CHECK(fixture.logger->contains(logging::LogLevel::WARN, "Ack send failed for evt_1"));

    token.cancel();
    CHECK(runner.join().code() == ErrorCode::CANCELLED);
}

TEST_CASE("EventListener - Malformed Frame Keeps Reading") {
    ListenerFixture fixture;
    CancellationToken token;
    ListenRunner runner(*fixture.listener, token);

    fixture.mock->push_text("this is not json");
    fixture.mock->push_text(R"({"type":"v2_event","payload":"{\"id\":\"evt_v2\"}","destination_id":"ed_1"})");

    REQUIRE(fixture.handler->wait_for_calls(1, std::chrono::seconds(5)));
    auto calls = fixture.handler->get_calls();
    CHECK(calls[0].kind == "v2");
    CHECK(calls[0].v2_payload.id == "evt_v2");
    CHECK(fixture.listener->get_statistics().frames_dropped == 1);

    token.cancel();
    CHECK(runner.join().code() == ErrorCode::CANCELLED);
}

TEST_CASE("EventListener - Listen All Setup Failures") {
    SUBCASE("Authorization rejected") {
        ListenerFixture fixture;
        fixture.http->set_response(401, "unauthorized");
        CancellationToken token;

        Status status = fixture.listener->listen_all(token);
        CHECK(status.code() == ErrorCode::AUTH_FAILED);
        CHECK(status.error().http_status == 401);
        CHECK(fixture.mock->get_dial_options().url.empty());
    }

    SUBCASE("Dial rejected") {
        ListenerFixture fixture;
        fixture.mock->fail_connect("bad handshake", 0, "");
        CancellationToken token;

        Status status = fixture.listener->listen_all(token);
        CHECK(status.code() == ErrorCode::CONNECT_FAILED);
        CHECK(status.message() == "websocket dial: bad handshake");
    }

    SUBCASE("Already cancelled") {
        ListenerFixture fixture;
        CancellationToken token;
        token.cancel();

        Status status = fixture.listener->listen_all(token);
        CHECK(status.code() == ErrorCode::CANCELLED);
        CHECK(fixture.http->request_count() == 0);
    }
}
