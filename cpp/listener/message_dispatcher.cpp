#include "message_dispatcher.hpp"

namespace stripe_listener {

MessageDispatcher::MessageDispatcher(std::shared_ptr<IEventHandler> handler,
                                     FrameWriter writer,
                                     std::shared_ptr<logging::Logger> logger)
    : handler_(std::move(handler)), writer_(std::move(writer)), logger_(std::move(logger)) {
}

bool MessageDispatcher::handle_frame(const std::string& frame) {
    frames_received_++;

    auto decoded = wire::decode_envelope(frame);
    if (decoded.is_error()) {
        frames_dropped_++;
        logger_->warn(decoded.error().message,
                      {{"code", error_handling::error_code_to_string(decoded.code())},
                       {"bytes", std::to_string(frame.size())}});
        return false;
    }

    dispatch(decoded.value());
    return true;
}

void MessageDispatcher::dispatch(const InboundEnvelope& envelope) {
    if (const WebhookEvent* event = envelope.webhook_event()) {
        dispatch_webhook_event(*event);
    } else if (const V2Event* event = envelope.v2_event()) {
        dispatch_v2_event(*event);
    } else {
        unknown_messages_++;
        logger_->debug("Unrecognized message", {{"type", envelope.raw_type}});
        std::function<void()> callback = [&]() {
            handler_->on_unknown_message(envelope.raw_type, envelope.raw_data);
        };
        if (!error_handling::safe_callback(callback, *logger_, "on_unknown_message")) {
            handler_failures_++;
        }
    }
}

void MessageDispatcher::dispatch_webhook_event(const WebhookEvent& event) {
    webhook_events_++;

    StripeEventPayload payload;
    auto parsed = wire::parse_event_payload(event.event_payload);
    if (parsed.is_success()) {
        payload = parsed.value();
    } else {
        payload_decode_failures_++;
        logger_->warn(parsed.error().message,
                      {{"code", error_handling::error_code_to_string(parsed.code())},
                       {"webhook_id", event.webhook_id}});
    }

    EventAck ack;
    ack.event_id = payload.id;
    ack.webhook_conversation_id = event.webhook_conversation_id;
    ack.webhook_id = event.webhook_id;
    send_ack(ack);

    std::function<void()> callback = [&]() {
        handler_->on_webhook_event(event, payload);
    };
    if (!error_handling::safe_callback(callback, *logger_, "on_webhook_event")) {
        handler_failures_++;
    }
}

void MessageDispatcher::dispatch_v2_event(const V2Event& event) {
    v2_events_++;

    V2EventPayload payload;
    auto parsed = wire::parse_v2_payload(event.payload);
    if (parsed.is_success()) {
        payload = parsed.value();
    } else {
        payload_decode_failures_++;
        logger_->warn(parsed.error().message,
                      {{"code", error_handling::error_code_to_string(parsed.code())},
                       {"destination_id", event.destination_id}});
    }

    EventAck ack;
    ack.event_id = payload.id;
    ack.webhook_id = event.destination_id;
    send_ack(ack);

    std::function<void()> callback = [&]() {
        handler_->on_v2_event(event, payload);
    };
    if (!error_handling::safe_callback(callback, *logger_, "on_v2_event")) {
        handler_failures_++;
    }
}

void MessageDispatcher::send_ack(const EventAck& ack) {
    error_handling::Status status = writer_ ? writer_(wire::serialize_ack(ack))
        : error_handling::Status::error(error_handling::ErrorCode::WRITE_FAILED, "no frame writer");

    if (status.is_error()) {
        ack_failures_++;
        logger_->warn("Ack send failed for " + ack.event_id,
                      {{"code", error_handling::error_code_to_string(error_handling::ErrorCode::ACK_SEND_FAILED)},
                       {"error", status.message()}});
        return;
    }

    acks_sent_++;
    logger_->debug("Ack sent", {{"event_id", ack.event_id}, {"webhook_id", ack.webhook_id}});
}

MessageDispatcher::Statistics MessageDispatcher::get_statistics() const {
    Statistics stats;
    stats.frames_received = frames_received_.load();
    stats.frames_dropped = frames_dropped_.load();
    stats.webhook_events = webhook_events_.load();
    stats.v2_events = v2_events_.load();
    stats.unknown_messages = unknown_messages_.load();
    stats.acks_sent = acks_sent_.load();
    stats.ack_failures = ack_failures_.load();
    stats.payload_decode_failures = payload_decode_failures_.load();
    stats.handler_failures = handler_failures_.load();
    return stats;
}

} // namespace stripe_listener
