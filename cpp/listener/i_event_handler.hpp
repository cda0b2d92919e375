#pragma once
#include <string>
#include "listener_types.hpp"

namespace stripe_listener {

/**
 * Receives decoded events, one frame at a time, on the read thread and in
 * wire order. The acknowledgment for an event has already been written when
 * its callback runs. Exceptions thrown from a callback are logged and do not
 * stop the listener.
 */
class IEventHandler {
public:
    virtual ~IEventHandler() = default;

    virtual void on_webhook_event(const WebhookEvent& event, const StripeEventPayload& payload) = 0;
    virtual void on_v2_event(const V2Event& event, const V2EventPayload& payload) = 0;

    // Frames with a type the listener does not handle. No ack is sent.
    virtual void on_unknown_message(const std::string& raw_type, const std::string& raw_data) {
        (void)raw_type;
        (void)raw_data;
    }
};

} // namespace stripe_listener
