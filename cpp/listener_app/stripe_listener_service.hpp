#pragma once
#include <memory>
#include <thread>
#include "logging_event_handler.hpp"
#include "../listener/cancellation_token.hpp"
#include "../listener/event_listener.hpp"
#include "../utils/app_service/app_service.hpp"

namespace listener_app {

/**
 * Stripe Listener Service
 *
 * Extends AppService to stream events from the [listener] configuration
 * into the log. SIGINT/SIGTERM cancel the listener; a listener failure
 * stops the process with exit code 1.
 */
class StripeListenerService : public app_service::AppService {
public:
    StripeListenerService();
    ~StripeListenerService() override;

protected:
    bool configure_service() override;
    bool start_service() override;
    void stop_service() override;
    void print_service_stats() override;

private:
    void listen_worker();

    std::shared_ptr<logging::Logger> logger_;
    std::shared_ptr<LoggingEventHandler> handler_;
    std::unique_ptr<stripe_listener::EventListener> listener_;
    stripe_listener::CancellationToken token_;
    std::thread worker_;
};

} // namespace listener_app
