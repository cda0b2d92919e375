#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "i_event_handler.hpp"
#include "listener_types.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/logger.hpp"

namespace stripe_listener {

/**
 * Turns inbound frames into handler callbacks.
 *
 * Runs synchronously on the read thread. Frame and payload decode failures
 * and ack write failures are logged and never returned to the caller.
 */
class MessageDispatcher {
public:
    // Writes one text frame under the socket write lock
    using FrameWriter = std::function<error_handling::Status(const std::string&)>;

    struct Statistics {
        uint64_t frames_received{0};
        uint64_t frames_dropped{0};
        uint64_t webhook_events{0};
        uint64_t v2_events{0};
        uint64_t unknown_messages{0};
        uint64_t acks_sent{0};
        uint64_t ack_failures{0};
        uint64_t payload_decode_failures{0};
        uint64_t handler_failures{0};
    };

    MessageDispatcher(std::shared_ptr<IEventHandler> handler,
                      FrameWriter writer,
                      std::shared_ptr<logging::Logger> logger);

    // Decode then dispatch. Returns false when the frame was dropped.
    bool handle_frame(const std::string& frame);

    void dispatch(const InboundEnvelope& envelope);

    // Best effort, failures are logged
    void send_ack(const EventAck& ack);

    Statistics get_statistics() const;

private:
    void dispatch_webhook_event(const WebhookEvent& event);
    void dispatch_v2_event(const V2Event& event);

    std::shared_ptr<IEventHandler> handler_;
    FrameWriter writer_;
    std::shared_ptr<logging::Logger> logger_;

    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> frames_dropped_{0};
    std::atomic<uint64_t> webhook_events_{0};
    std::atomic<uint64_t> v2_events_{0};
    std::atomic<uint64_t> unknown_messages_{0};
    std::atomic<uint64_t> acks_sent_{0};
    std::atomic<uint64_t> ack_failures_{0};
    std::atomic<uint64_t> payload_decode_failures_{0};
    std::atomic<uint64_t> handler_failures_{0};
};

} // namespace stripe_listener
