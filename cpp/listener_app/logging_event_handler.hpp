#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include "../listener/i_event_handler.hpp"
#include "../utils/logging/logger.hpp"

namespace listener_app {

// Writes one log line per delivered event
class LoggingEventHandler : public stripe_listener::IEventHandler {
public:
    explicit LoggingEventHandler(std::shared_ptr<logging::Logger> logger);

    void on_webhook_event(const stripe_listener::WebhookEvent& event,
                          const stripe_listener::StripeEventPayload& payload) override;
    void on_v2_event(const stripe_listener::V2Event& event,
                     const stripe_listener::V2EventPayload& payload) override;
    void on_unknown_message(const std::string& raw_type, const std::string& raw_data) override;

    uint64_t events_logged() const { return events_logged_.load(); }

private:
    std::shared_ptr<logging::Logger> logger_;
    std::atomic<uint64_t> events_logged_{0};
};

} // namespace listener_app
