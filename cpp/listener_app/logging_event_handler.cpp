#include "logging_event_handler.hpp"

namespace listener_app {

LoggingEventHandler::LoggingEventHandler(std::shared_ptr<logging::Logger> logger)
    : logger_(std::move(logger)) {
}

void LoggingEventHandler::on_webhook_event(const stripe_listener::WebhookEvent& event,
                                           const stripe_listener::StripeEventPayload& payload) {
    events_logged_.fetch_add(1);
    std::map<std::string, std::string> metadata{
        {"id", payload.id},
        {"webhook_id", event.webhook_id},
        {"livemode", payload.livemode ? "true" : "false"}};
    if (event.endpoint_api_version) {
        metadata["api_version"] = *event.endpoint_api_version;
    }
    logger_->info("--> " + payload.type, metadata);
}

void LoggingEventHandler::on_v2_event(const stripe_listener::V2Event& event,
                                      const stripe_listener::V2EventPayload& payload) {
    events_logged_.fetch_add(1);
    logger_->info("--> v2 " + payload.type,
                  {{"id", payload.id}, {"destination_id", event.destination_id}});
}

void LoggingEventHandler::on_unknown_message(const std::string& raw_type, const std::string& raw_data) {
    logger_->debug("Unhandled message type '" + raw_type + "'", {{"bytes", std::to_string(raw_data.size())}});
}

} // namespace listener_app
