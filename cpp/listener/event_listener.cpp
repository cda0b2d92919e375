#include "event_listener.hpp"
#include <mutex>
#include <stdexcept>
#include <thread>
#include "../websocket/websocket_transport.hpp"

namespace stripe_listener {

using error_handling::ErrorCode;
using error_handling::Result;
using error_handling::Status;
namespace ws = websocket_transport;

namespace {

std::shared_ptr<logging::Logger> default_logger(std::shared_ptr<logging::Logger> logger) {
    return logger ? logger : std::make_shared<logging::Logger>("STRIPE_LISTENER");
}

std::shared_ptr<IHttpHandler> default_http_handler(std::shared_ptr<IHttpHandler> handler) {
    if (handler) {
        return handler;
    }
    return std::shared_ptr<IHttpHandler>(HttpHandlerFactory::create());
}

ws::TransportFactory default_transport_factory(ws::TransportFactory factory) {
    return factory ? factory : ws::WebSocketTransportFactory::default_factory();
}

ListenerConfig with_defaults(ListenerConfig config) {
    config.apply_defaults();
    return config;
}

} // namespace

const char* listener_state_to_string(ListenerState state) {
    switch (state) {
        case ListenerState::CREATED: return "CREATED";
        case ListenerState::AUTHORIZED: return "AUTHORIZED";
        case ListenerState::CONNECTED: return "CONNECTED";
        case ListenerState::LISTENING: return "LISTENING";
        case ListenerState::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

EventListener::EventListener(ListenerConfig config,
                             std::shared_ptr<IEventHandler> handler,
                             std::shared_ptr<logging::Logger> logger,
                             std::shared_ptr<IHttpHandler> http_handler,
                             ws::TransportFactory transport_factory)
    : config_(with_defaults(std::move(config))),
      logger_(default_logger(std::move(logger))),
      handler_(std::move(handler)),
      transport_(config_, default_http_handler(std::move(http_handler)),
                 default_transport_factory(std::move(transport_factory)), logger_),
      dispatcher_(handler_,
                  [this](const std::string& frame) { return transport_.send_text(frame); },
                  logger_) {
    if (!handler_) {
        throw std::invalid_argument("EventListener requires an event handler");
    }
}

EventListener::~EventListener() {
    transport_.close_socket();
}

Result<Session> EventListener::authorize() {
    auto result = transport_.authorize();
    if (result.is_success()) {
        state_ = ListenerState::AUTHORIZED;
    } else {
        logger_->error("Authorization failed", {{"error", result.error().message}});
    }
    return result;
}

Status EventListener::connect() {
    Status status = transport_.connect();
    if (status.is_success()) {
        state_ = ListenerState::CONNECTED;
    } else {
        logger_->error("Connect failed", {{"error", status.message()}});
    }
    return status;
}

std::optional<Session> EventListener::session() const {
    return transport_.session();
}

Status EventListener::listen(const CancellationToken& token) {
    if (!transport_.is_connected()) {
        return Status::error(ErrorCode::PRECONDITION_FAILED, "call connect before listen");
    }

    state_ = ListenerState::LISTENING;
    logger_->info("Listening for events");

    // Cancelled by the caller's token or by the first loop to finish
    CancellationToken loop_token;
    CancellationSubscription link(token, [loop_token]() mutable { loop_token.cancel(); });

    std::mutex result_mutex;
    std::optional<Status> loop_result;
    auto finish = [&](Status status) {
        {
            std::lock_guard<std::mutex> lock(result_mutex);
            if (!loop_result && !loop_token.is_cancelled()) {
                loop_result = std::move(status);
            }
        }
        loop_token.cancel();
    };

    std::thread keepalive_thread([&]() { finish(keepalive_loop(loop_token)); });
    std::thread read_thread([&]() { finish(read_loop(loop_token)); });

    loop_token.wait();
    close_connection();

    read_thread.join();
    keepalive_thread.join();
    state_ = ListenerState::CLOSED;

    Status result = loop_result ? *loop_result
                                : Status::error(ErrorCode::CANCELLED, "listen cancelled");
    if (result.is_success()) {
        logger_->info("Listener stopped, connection closed by peer");
    } else if (result.code() == ErrorCode::CANCELLED) {
        logger_->info("Listener stopped");
    } else {
        logger_->error("Listener failed", {{"error", result.message()}});
    }
    return result;
}

Status EventListener::listen_all(const CancellationToken& token) {
    if (token.is_cancelled()) {
        return Status::error(ErrorCode::CANCELLED, "listen cancelled");
    }
    auto session = authorize();
    if (session.is_error()) {
        return Status::from(session);
    }

    if (token.is_cancelled()) {
        return Status::error(ErrorCode::CANCELLED, "listen cancelled");
    }
    Status status = connect();
    if (status.is_error()) {
        return status;
    }

    return listen(token);
}

Status EventListener::read_loop(const CancellationToken& token) {
    transport_.set_pong_handler([this]() {
        transport_.set_read_deadline(ws::Clock::now() + config_.pong_wait);
    });

    while (true) {
        transport_.set_read_deadline(ws::Clock::now() + config_.pong_wait);
        ws::ReadResult result = transport_.read_message();

        if (result.status == ws::ReadStatus::MESSAGE) {
            dispatcher_.handle_frame(result.message.data);
            continue;
        }

        if (token.is_cancelled()) {
            return Status::ok();
        }
        if (result.status == ws::ReadStatus::CLOSED && result.close_code == ws::CLOSE_NORMAL) {
            return Status::ok();
        }
        return Status::error(ErrorCode::READ_FAILED, "read: " + result.error_message);
    }
}

Status EventListener::keepalive_loop(const CancellationToken& token) {
    while (!token.wait_for(config_.ping_period)) {
        Status status = transport_.send_ping();
        if (status.is_error()) {
            return Status::error(ErrorCode::WRITE_FAILED, status.message());
        }
        logger_->debug("Ping sent");
    }
    return Status::ok();
}

void EventListener::close_connection() {
    Status status = transport_.send_close(ws::CLOSE_NORMAL, "done");
    if (status.is_error()) {
        logger_->debug("Close frame not sent", {{"error", status.message()}});
    }
    std::this_thread::sleep_for(config_.close_grace);
    transport_.close_socket();
}

} // namespace stripe_listener
