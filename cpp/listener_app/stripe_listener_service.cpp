#include "stripe_listener_service.hpp"
#include "../utils/logging/log_helper.hpp"

namespace listener_app {

StripeListenerService::StripeListenerService()
    : app_service::AppService("stripe_listener"),
      logger_(std::make_shared<logging::Logger>("STRIPE_LISTENER")) {
}

StripeListenerService::~StripeListenerService() {
    stop();
}

bool StripeListenerService::configure_service() {
    stripe_listener::ListenerConfig cfg =
        stripe_listener::ListenerConfig::from_process_config(*get_config_manager());

    auto errors = cfg.validate();
    if (!errors.empty()) {
        for (const auto& error : errors) {
            LOG_ERROR_COMP("LISTENER_SERVICE", "Invalid configuration: " + error);
        }
        return false;
    }

    std::string features;
    for (const auto& feature : cfg.websocket_features) {
        features += (features.empty() ? "" : ",") + feature;
    }
    LOG_INFO_COMP("LISTENER_SERVICE", "API base: " + cfg.api_base);
    LOG_INFO_COMP("LISTENER_SERVICE", "Device name: " + cfg.device_name);
    LOG_INFO_COMP("LISTENER_SERVICE", "Features: " + features);

    handler_ = std::make_shared<LoggingEventHandler>(logger_);
    listener_ = std::make_unique<stripe_listener::EventListener>(std::move(cfg), handler_, logger_);
    return true;
}

bool StripeListenerService::start_service() {
    if (!listener_) {
        return false;
    }

    worker_ = std::thread(&StripeListenerService::listen_worker, this);
    return true;
}

void StripeListenerService::stop_service() {
    token_.cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void StripeListenerService::print_service_stats() {
    if (!listener_) {
        return;
    }

    auto stats = listener_->get_statistics();
    LOG_INFO_COMP("LISTENER_SERVICE", "=== Listener Statistics ===");
    LOG_INFO_COMP("LISTENER_SERVICE", "State: " +
                  std::string(stripe_listener::listener_state_to_string(listener_->get_state())));
    LOG_INFO_COMP("LISTENER_SERVICE", "Frames received: " + std::to_string(stats.frames_received) +
                  " (dropped " + std::to_string(stats.frames_dropped) + ")");
    LOG_INFO_COMP("LISTENER_SERVICE", "Webhook events: " + std::to_string(stats.webhook_events) +
                  ", v2 events: " + std::to_string(stats.v2_events) +
                  ", unknown: " + std::to_string(stats.unknown_messages));
    LOG_INFO_COMP("LISTENER_SERVICE", "Acks sent: " + std::to_string(stats.acks_sent) +
                  ", ack failures: " + std::to_string(stats.ack_failures));
    LOG_INFO_COMP("LISTENER_SERVICE", "Payload decode failures: " + std::to_string(stats.payload_decode_failures) +
                  ", handler failures: " + std::to_string(stats.handler_failures));
}

void StripeListenerService::listen_worker() {
    error_handling::Status status = listener_->listen_all(token_);

    if (status.is_success()) {
        LOG_INFO_COMP("LISTENER_SERVICE", "Connection closed by the server");
        request_stop(0);
    } else if (status.code() == error_handling::ErrorCode::CANCELLED) {
        LOG_INFO_COMP("LISTENER_SERVICE", "Listener cancelled");
        request_stop(0);
    } else {
        LOG_ERROR_COMP("LISTENER_SERVICE", "Listener failed: " + status.message());
        request_stop(1);
    }
}

} // namespace listener_app
