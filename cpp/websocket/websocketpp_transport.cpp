#include "websocketpp_transport.hpp"
#include <boost/asio/ssl/host_name_verification.hpp>

namespace websocket_transport {

namespace {

typedef websocketpp::lib::shared_ptr<websocketpp::lib::asio::ssl::context> context_ptr;

ReadResult not_connected_read() {
    ReadResult result;
    result.status = ReadStatus::ERROR;
    result.error_message = "websocket not connected";
    return result;
}

error_handling::Status not_connected_write() {
    return error_handling::Status::error(error_handling::ErrorCode::WRITE_FAILED,
                                         "write: websocket not connected");
}

} // namespace

void configure_tls(tls_client& client, const std::string& host, bool verify_ssl) {
    client.set_tls_init_handler([host, verify_ssl](websocketpp::connection_hdl) {
        namespace ssl = websocketpp::lib::asio::ssl;
        context_ptr ctx = websocketpp::lib::make_shared<ssl::context>(ssl::context::tlsv12_client);

        ctx->set_options(ssl::context::default_workarounds |
                         ssl::context::no_sslv2 |
                         ssl::context::no_sslv3 |
                         ssl::context::single_dh_use);
        if (verify_ssl) {
            ctx->set_default_verify_paths();
            ctx->set_verify_mode(ssl::verify_peer);
            ctx->set_verify_callback(ssl::host_name_verification(host));
        } else {
            ctx->set_verify_mode(ssl::verify_none);
        }
        return ctx;
    });
}

void configure_tls(plain_client&, const std::string&, bool) {
}

DialResult WebsocketppTransport::connect(const DialOptions& options) {
    if (options.url.rfind("wss://", 0) == 0) {
        connection_ = std::make_unique<WebsocketppConnection<tls_client>>();
    } else if (options.url.rfind("ws://", 0) == 0) {
        connection_ = std::make_unique<WebsocketppConnection<plain_client>>();
    } else {
        DialResult result;
        result.error_message = "unsupported websocket scheme: " + options.url;
        return result;
    }
    return connection_->connect(options);
}

void WebsocketppTransport::disconnect() {
    if (connection_) {
        connection_->disconnect();
    }
}

bool WebsocketppTransport::is_connected() const {
    return connection_ && connection_->is_connected();
}

WebSocketState WebsocketppTransport::get_state() const {
    return connection_ ? connection_->get_state() : WebSocketState::DISCONNECTED;
}

ReadResult WebsocketppTransport::read_message() {
    return connection_ ? connection_->read_message() : not_connected_read();
}

void WebsocketppTransport::set_read_deadline(Deadline deadline) {
    if (connection_) {
        connection_->set_read_deadline(deadline);
    }
}

void WebsocketppTransport::set_pong_handler(PongCallback callback) {
    if (connection_) {
        connection_->set_pong_handler(std::move(callback));
    }
}

error_handling::Status WebsocketppTransport::send_text(const std::string& message, Deadline deadline) {
    return connection_ ? connection_->send_text(message, deadline) : not_connected_write();
}

error_handling::Status WebsocketppTransport::send_ping(Deadline deadline) {
    return connection_ ? connection_->send_ping(deadline) : not_connected_write();
}

error_handling::Status WebsocketppTransport::send_close(uint16_t code, const std::string& reason, Deadline deadline) {
    return connection_ ? connection_->send_close(code, reason, deadline) : not_connected_write();
}

} // namespace websocket_transport
