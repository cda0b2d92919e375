#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "listener_config.hpp"
#include "listener_types.hpp"
#include "../utils/http/i_http_handler.hpp"
#include "../utils/logging/logger.hpp"
#include "../utils/error_handling.hpp"
#include "../websocket/i_websocket_transport.hpp"

namespace stripe_listener {

/**
 * Owns the session and the socket.
 *
 * authorize() and connect() are called from the owning thread before the
 * loops start. Once listening, the read side is used only by the read loop
 * and every write goes through a single lock.
 */
class TransportClient {
public:
    TransportClient(const ListenerConfig& config,
                    std::shared_ptr<IHttpHandler> http_handler,
                    websocket_transport::TransportFactory transport_factory,
                    std::shared_ptr<logging::Logger> logger);
    ~TransportClient();

    TransportClient(const TransportClient&) = delete;
    TransportClient& operator=(const TransportClient&) = delete;

    // POST /v1/stripecli/sessions
    error_handling::Result<Session> authorize();

    // Dial {websocket_url}?websocket_feature={feature}. Requires a session.
    error_handling::Status connect();

    const std::optional<Session>& session() const { return session_; }
    bool is_connected() const;

    // URL dialed by connect(), empty without a session
    std::string dial_url() const;

    // Read side, read loop only
    websocket_transport::ReadResult read_message();
    void set_read_deadline(websocket_transport::Deadline deadline);
    void set_pong_handler(websocket_transport::PongCallback callback);

    // Write side, serialized. Each write gets write_wait to complete.
    error_handling::Status send_text(const std::string& message);
    error_handling::Status send_ping();
    error_handling::Status send_close(uint16_t code, const std::string& reason);

    // Forced close. The socket object is kept until the next connect() or
    // destruction so a blocked reader can return safely.
    void close_socket();

private:
    websocket_transport::Deadline write_deadline() const;

    const ListenerConfig& config_;
    std::shared_ptr<IHttpHandler> http_handler_;
    websocket_transport::TransportFactory transport_factory_;
    std::shared_ptr<logging::Logger> logger_;

    std::optional<Session> session_;
    std::unique_ptr<websocket_transport::IWebSocketTransport> transport_;
    std::mutex write_mutex_;
};

} // namespace stripe_listener
