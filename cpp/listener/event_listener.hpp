#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include "cancellation_token.hpp"
#include "i_event_handler.hpp"
#include "listener_config.hpp"
#include "listener_types.hpp"
#include "message_dispatcher.hpp"
#include "transport_client.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/http/i_http_handler.hpp"
#include "../utils/logging/logger.hpp"
#include "../websocket/i_websocket_transport.hpp"

namespace stripe_listener {

enum class ListenerState {
    CREATED,
    AUTHORIZED,
    CONNECTED,
    LISTENING,
    CLOSED
};

const char* listener_state_to_string(ListenerState state);

/**
 * Streams events from the Stripe CLI websocket endpoint into an IEventHandler.
 *
 * Usage:
 *   EventListener listener(config, handler);
 *   CancellationToken token;
 *   Status status = listener.listen_all(token);   // blocks
 *
 * listen() runs a read thread and a keepalive thread over one socket and
 * returns when the token is cancelled or either loop fails. A single
 * connection is used; there is no reconnection.
 */
class EventListener {
public:
    EventListener(ListenerConfig config,
                  std::shared_ptr<IEventHandler> handler,
                  std::shared_ptr<logging::Logger> logger = nullptr,
                  std::shared_ptr<IHttpHandler> http_handler = nullptr,
                  websocket_transport::TransportFactory transport_factory = nullptr);
    ~EventListener();

    EventListener(const EventListener&) = delete;
    EventListener& operator=(const EventListener&) = delete;

    error_handling::Result<Session> authorize();
    error_handling::Status connect();

    /**
     * Blocks until cancellation or a loop-fatal error.
     *
     * @return ok when the peer closed normally, CANCELLED when the token
     *         was cancelled, READ_FAILED or WRITE_FAILED otherwise
     */
    error_handling::Status listen(const CancellationToken& token);

    // authorize() + connect() + listen()
    error_handling::Status listen_all(const CancellationToken& token);

    // Empty before a successful authorize()
    std::optional<Session> session() const;

    ListenerState get_state() const { return state_.load(); }
    const ListenerConfig& config() const { return config_; }
    MessageDispatcher::Statistics get_statistics() const { return dispatcher_.get_statistics(); }

private:
    error_handling::Status read_loop(const CancellationToken& token);
    error_handling::Status keepalive_loop(const CancellationToken& token);

    // Close frame, grace period, then forced close
    void close_connection();

    ListenerConfig config_;
    std::shared_ptr<logging::Logger> logger_;
    std::shared_ptr<IEventHandler> handler_;
    TransportClient transport_;
    MessageDispatcher dispatcher_;
    std::atomic<ListenerState> state_{ListenerState::CREATED};
};

} // namespace stripe_listener
