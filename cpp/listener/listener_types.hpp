#pragma once
#include <string>
#include <map>
#include <optional>
#include <variant>
#include <chrono>
#include <cstdint>
#include <json/json.h>
#include "../utils/error_handling.hpp"

namespace stripe_listener {

// Result of POST /v1/stripecli/sessions
struct Session {
    std::chrono::seconds reconnect_delay{0};
    std::string secret;
    std::string websocket_authorized_feature;
    std::string websocket_id;
    std::string websocket_url;
    std::string default_version;     // minimum API version
    std::string latest_version;      // maximum API version
};

// v1 webhook event pushed over the socket
struct WebhookEvent {
    std::optional<std::string> endpoint_api_version;
    std::string event_payload;       // raw JSON text of the Stripe event
    std::map<std::string, std::string> http_headers;
    std::string webhook_conversation_id;
    std::string webhook_id;
};

// v2 thin event pushed over the socket
struct V2Event {
    std::string payload;             // raw JSON text of the thin event
    std::map<std::string, std::string> http_headers;
    std::string destination_id;
};

// Any frame whose type the listener does not handle
struct UnrecognizedMessage {
};

using EnvelopeBody = std::variant<WebhookEvent, V2Event, UnrecognizedMessage>;

// One decoded inbound frame
struct InboundEnvelope {
    std::string raw_type;
    std::string raw_data;
    EnvelopeBody body;

    const WebhookEvent* webhook_event() const { return std::get_if<WebhookEvent>(&body); }
    const V2Event* v2_event() const { return std::get_if<V2Event>(&body); }
    bool is_unrecognized() const { return std::holds_alternative<UnrecognizedMessage>(body); }
};

// Parsed contents of WebhookEvent::event_payload. Empty id/type when the
// payload could not be parsed.
struct StripeEventPayload {
    std::string id;
    std::string type;
    int64_t created{0};
    bool livemode{false};
    std::string api_version;
    int pending_webhooks{0};
    Json::Value data{Json::objectValue};
};

// Parsed contents of V2Event::payload
struct V2EventPayload {
    std::string id;
    std::string type;
};

// Outbound acknowledgment of one delivered event
struct EventAck {
    std::string type{"event_ack"};
    std::string event_id;
    std::string webhook_conversation_id;
    std::string webhook_id;
};

namespace wire {

constexpr const char* TYPE_WEBHOOK_EVENT = "webhook_event";
constexpr const char* TYPE_V2_EVENT = "v2_event";

// Session from the authorization response body
error_handling::Result<Session> parse_session(const std::string& body);

/**
 * Two-phase frame decode: the "type" discriminator is read first, then the
 * matching arm is decoded. Fails with FRAME_DECODE_FAILED when the frame is
 * not a JSON object or a known arm has fields of the wrong JSON type.
 */
error_handling::Result<InboundEnvelope> decode_envelope(const std::string& frame);

// Fail with PAYLOAD_DECODE_FAILED when the text is not a JSON object.
// Fields of an unexpected type are left at their defaults.
error_handling::Result<StripeEventPayload> parse_event_payload(const std::string& payload);
error_handling::Result<V2EventPayload> parse_v2_payload(const std::string& payload);

// Compact JSON for the socket
std::string serialize_ack(const EventAck& ack);

} // namespace wire

} // namespace stripe_listener
