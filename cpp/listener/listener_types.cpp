#include "listener_types.hpp"
#include <memory>
#include <sstream>

namespace stripe_listener {
namespace wire {

using error_handling::ErrorCode;
using error_handling::Result;

namespace {

bool parse_json(const std::string& text, Json::Value& root, std::string& errors) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["allowComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), &root, &errors);
}

// Strict field readers used for envelopes. A missing or null field keeps
// the default; any other type mismatch is a decode error.

bool read_string(const Json::Value& obj, const char* key, std::string& out, std::string& error) {
    const Json::Value& value = obj[key];
    if (value.isNull()) {
        return true;
    }
    if (!value.isString()) {
        error = std::string("field '") + key + "' is not a string";
        return false;
    }
    out = value.asString();
    return true;
}

bool read_headers(const Json::Value& obj, const char* key,
                  std::map<std::string, std::string>& out, std::string& error) {
    const Json::Value& value = obj[key];
    if (value.isNull()) {
        return true;
    }
    if (!value.isObject()) {
        error = std::string("field '") + key + "' is not an object";
        return false;
    }
    for (const auto& name : value.getMemberNames()) {
        const Json::Value& header = value[name];
        if (!header.isString()) {
            error = std::string("header '") + name + "' is not a string";
            return false;
        }
        out[name] = header.asString();
    }
    return true;
}

bool decode_webhook_event(const Json::Value& root, WebhookEvent& event, std::string& error) {
    const Json::Value& endpoint = root["endpoint"];
    if (!endpoint.isNull()) {
        if (!endpoint.isObject()) {
            error = "field 'endpoint' is not an object";
            return false;
        }
        const Json::Value& api_version = endpoint["api_version"];
        if (api_version.isString()) {
            event.endpoint_api_version = api_version.asString();
        } else if (!api_version.isNull()) {
            error = "field 'endpoint.api_version' is not a string";
            return false;
        }
    }

    return read_string(root, "event_payload", event.event_payload, error) &&
           read_headers(root, "http_headers", event.http_headers, error) &&
           read_string(root, "webhook_conversation_id", event.webhook_conversation_id, error) &&
           read_string(root, "webhook_id", event.webhook_id, error);
}

bool decode_v2_event(const Json::Value& root, V2Event& event, std::string& error) {
    return read_string(root, "payload", event.payload, error) &&
           read_headers(root, "http_headers", event.http_headers, error) &&
           read_string(root, "destination_id", event.destination_id, error);
}

} // namespace

Result<Session> parse_session(const std::string& body) {
    Json::Value root;
    std::string errors;
    if (!parse_json(body, root, errors) || !root.isObject()) {
        return Result<Session>::error(ErrorCode::AUTH_FAILED,
            "decode session: " + (errors.empty() ? std::string("expected a JSON object") : errors));
    }

    Session session;
    std::string error;
    const Json::Value& delay = root["reconnect_delay"];
    if (delay.isInt64() && delay.asInt64() >= 0) {
        session.reconnect_delay = std::chrono::seconds(delay.asInt64());
    } else if (!delay.isNull()) {
        return Result<Session>::error(ErrorCode::AUTH_FAILED,
            "decode session: field 'reconnect_delay' is not a non-negative integer");
    }

    if (!read_string(root, "secret", session.secret, error) ||
        !read_string(root, "websocket_authorized_feature", session.websocket_authorized_feature, error) ||
        !read_string(root, "websocket_id", session.websocket_id, error) ||
        !read_string(root, "websocket_url", session.websocket_url, error) ||
        !read_string(root, "default_version", session.default_version, error) ||
        !read_string(root, "latest_version", session.latest_version, error)) {
        return Result<Session>::error(ErrorCode::AUTH_FAILED, "decode session: " + error);
    }

    return Result<Session>::success(std::move(session));
}

Result<InboundEnvelope> decode_envelope(const std::string& frame) {
    Json::Value root;
    std::string errors;
    if (!parse_json(frame, root, errors)) {
        return Result<InboundEnvelope>::error(ErrorCode::FRAME_DECODE_FAILED, "malformed message: " + errors);
    }
    if (!root.isObject()) {
        return Result<InboundEnvelope>::error(ErrorCode::FRAME_DECODE_FAILED,
                                              "malformed message: expected a JSON object");
    }

    InboundEnvelope envelope;
    envelope.raw_data = frame;

    const Json::Value& type = root["type"];
    if (type.isString()) {
        envelope.raw_type = type.asString();
    } else if (!type.isNull()) {
        return Result<InboundEnvelope>::error(ErrorCode::FRAME_DECODE_FAILED,
                                              "malformed message: field 'type' is not a string");
    }

    std::string error;
    if (envelope.raw_type == TYPE_WEBHOOK_EVENT) {
        WebhookEvent event;
        if (!decode_webhook_event(root, event, error)) {
            return Result<InboundEnvelope>::error(ErrorCode::FRAME_DECODE_FAILED, "malformed message: " + error);
        }
        envelope.body = std::move(event);
    } else if (envelope.raw_type == TYPE_V2_EVENT) {
        V2Event event;
        if (!decode_v2_event(root, event, error)) {
            return Result<InboundEnvelope>::error(ErrorCode::FRAME_DECODE_FAILED, "malformed message: " + error);
        }
        envelope.body = std::move(event);
    } else {
        envelope.body = UnrecognizedMessage{};
    }

    return Result<InboundEnvelope>::success(std::move(envelope));
}

Result<StripeEventPayload> parse_event_payload(const std::string& payload) {
    Json::Value root;
    std::string errors;
    if (!parse_json(payload, root, errors) || !root.isObject()) {
        return Result<StripeEventPayload>::error(ErrorCode::PAYLOAD_DECODE_FAILED,
            "parse event payload: " + (errors.empty() ? std::string("expected a JSON object") : errors));
    }

    StripeEventPayload event;
    if (root["id"].isString()) event.id = root["id"].asString();
    if (root["type"].isString()) event.type = root["type"].asString();
    if (root["created"].isInt64()) event.created = root["created"].asInt64();
    if (root["livemode"].isBool()) event.livemode = root["livemode"].asBool();
    if (root["api_version"].isString()) event.api_version = root["api_version"].asString();
    if (root["pending_webhooks"].isInt()) event.pending_webhooks = root["pending_webhooks"].asInt();
    if (root["data"].isObject()) event.data = root["data"];

    return Result<StripeEventPayload>::success(std::move(event));
}

Result<V2EventPayload> parse_v2_payload(const std::string& payload) {
    Json::Value root;
    std::string errors;
    if (!parse_json(payload, root, errors) || !root.isObject()) {
        return Result<V2EventPayload>::error(ErrorCode::PAYLOAD_DECODE_FAILED,
            "parse v2 event payload: " + (errors.empty() ? std::string("expected a JSON object") : errors));
    }

    V2EventPayload event;
    if (root["id"].isString()) event.id = root["id"].asString();
    if (root["type"].isString()) event.type = root["type"].asString();

    return Result<V2EventPayload>::success(std::move(event));
}

std::string serialize_ack(const EventAck& ack) {
    Json::Value root(Json::objectValue);
    root["type"] = ack.type;
    root["event_id"] = ack.event_id;
    root["webhook_conversation_id"] = ack.webhook_conversation_id;
    root["webhook_id"] = ack.webhook_id;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}

} // namespace wire
} // namespace stripe_listener
