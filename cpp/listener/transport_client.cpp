#include "transport_client.hpp"
#include "client_identity.hpp"

namespace stripe_listener {

using error_handling::Error;
using error_handling::ErrorCode;
using error_handling::Result;
using error_handling::Status;
namespace ws = websocket_transport;

TransportClient::TransportClient(const ListenerConfig& config,
                                 std::shared_ptr<IHttpHandler> http_handler,
                                 ws::TransportFactory transport_factory,
                                 std::shared_ptr<logging::Logger> logger)
    : config_(config),
      http_handler_(std::move(http_handler)),
      transport_factory_(std::move(transport_factory)),
      logger_(std::move(logger)) {
}

TransportClient::~TransportClient() {
    close_socket();
}

Result<Session> TransportClient::authorize() {
    if (!http_handler_->is_initialized() && !http_handler_->initialize()) {
        return Result<Session>::error(ErrorCode::AUTH_FAILED, "authorize request: HTTP handler failed to initialize");
    }

    HttpRequest request;
    request.method = "POST";
    request.url = config_.api_base + SESSION_PATH;
    request.headers = ClientIdentity::headers(config_.api_key);
    request.form_fields.emplace_back("device_name", config_.device_name);
    for (const auto& feature : config_.websocket_features) {
        request.form_fields.emplace_back("websocket_features[]", feature);
    }
    request.timeout_ms = static_cast<int>(config_.http_timeout.count());
    request.verify_ssl = config_.verify_ssl;

    logger_->debug("Requesting session", {{"url", request.url}});
    HttpResponse response = http_handler_->make_request(request);

    if (response.status_code == 0) {
        return Result<Session>::error(ErrorCode::AUTH_FAILED, "authorize request: " + response.error_message);
    }
    if (!response.success) {
        Error err;
        err.code = ErrorCode::AUTH_FAILED;
        err.message = "authorize failed (HTTP " + std::to_string(response.status_code) + "): " + response.body;
        err.http_status = response.status_code;
        err.response_body = response.body;
        return Result<Session>::error(std::move(err));
    }

    auto parsed = wire::parse_session(response.body);
    if (parsed.is_error()) {
        return parsed;
    }

    session_ = parsed.value();
    logger_->info("Session created", {{"websocket_id", session_->websocket_id},
                                      {"feature", session_->websocket_authorized_feature}});
    return parsed;
}

std::string TransportClient::dial_url() const {
    if (!session_) {
        return "";
    }
    return session_->websocket_url + "?websocket_feature=" + session_->websocket_authorized_feature;
}

Status TransportClient::connect() {
    if (!session_) {
        return Status::error(ErrorCode::PRECONDITION_FAILED, "call authorize before connect");
    }

    ws::DialOptions options;
    options.url = dial_url();
    options.headers = ClientIdentity::headers();
    options.headers["Websocket-Id"] = session_->websocket_id;
    options.subprotocols.push_back(SUBPROTOCOL);
    options.handshake_timeout = config_.handshake_timeout;
    options.proxy = config_.proxy;
    options.verify_ssl = config_.verify_ssl;

    // A previous socket is never reused
    close_socket();

    std::unique_ptr<ws::IWebSocketTransport> transport = transport_factory_();
    if (!transport) {
        return Status::error(ErrorCode::CONNECT_FAILED, "websocket dial: no transport available");
    }

    logger_->debug("Dialing websocket", {{"url", options.url}});
    ws::DialResult dial = transport->connect(options);
    if (!dial.success) {
        Error err;
        err.code = ErrorCode::CONNECT_FAILED;
        err.message = "websocket dial: " + dial.error_message;
        if (!dial.response_body.empty()) {
            err.message += " | " + dial.response_body;
        }
        err.http_status = dial.http_status;
        err.response_body = dial.response_body;
        return Status::error(std::move(err));
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        transport_ = std::move(transport);
    }
    logger_->info("Websocket connected");
    return Status::ok();
}

bool TransportClient::is_connected() const {
    return transport_ && transport_->is_connected();
}

ws::ReadResult TransportClient::read_message() {
    if (!transport_) {
        ws::ReadResult result;
        result.status = ws::ReadStatus::ERROR;
        result.error_message = "websocket not connected";
        return result;
    }
    return transport_->read_message();
}

void TransportClient::set_read_deadline(ws::Deadline deadline) {
    if (transport_) {
        transport_->set_read_deadline(deadline);
    }
}

void TransportClient::set_pong_handler(ws::PongCallback callback) {
    if (transport_) {
        transport_->set_pong_handler(std::move(callback));
    }
}

ws::Deadline TransportClient::write_deadline() const {
    return ws::Clock::now() + config_.write_wait;
}

Status TransportClient::send_text(const std::string& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!transport_) {
        return Status::error(ErrorCode::WRITE_FAILED, "write: websocket not connected");
    }
    return transport_->send_text(message, write_deadline());
}

Status TransportClient::send_ping() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!transport_) {
        return Status::error(ErrorCode::WRITE_FAILED, "ping: websocket not connected");
    }
    return transport_->send_ping(write_deadline());
}

Status TransportClient::send_close(uint16_t code, const std::string& reason) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!transport_) {
        return Status::error(ErrorCode::WRITE_FAILED, "close: websocket not connected");
    }
    return transport_->send_close(code, reason, write_deadline());
}

void TransportClient::close_socket() {
    if (transport_) {
        transport_->disconnect();
    }
}

} // namespace stripe_listener
