#pragma once
#include "i_websocket_transport.hpp"
#include "../utils/logging/logger.hpp"
#include <atomic>
#include <thread>
#include <mutex>
#include <deque>
#include <condition_variable>
#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

namespace websocket_transport {

typedef websocketpp::client<websocketpp::config::asio_tls_client> tls_client;
typedef websocketpp::client<websocketpp::config::asio_client> plain_client;

// TLS context for wss:// connections; no-op for ws://
void configure_tls(tls_client& client, const std::string& host, bool verify_ssl);
void configure_tls(plain_client& client, const std::string& host, bool verify_ssl);

/**
 * One websocketpp connection driven by its own Asio I/O thread.
 *
 * Handlers running on the I/O thread hand inbound frames, pongs, close
 * and failure notifications to the blocking reader through inbox_.
 */
template <typename Client>
class WebsocketppConnection : public IWebSocketTransport {
public:
    typedef typename Client::message_ptr message_ptr;
    typedef typename Client::connection_ptr connection_ptr;

    WebsocketppConnection() : logger_("WS_TRANSPORT") {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();
    }

    ~WebsocketppConnection() override {
        disconnect();
    }

    DialResult connect(const DialOptions& options) override {
        DialResult result;

        if (state_.load() != WebSocketState::DISCONNECTED || io_thread_.joinable()) {
            result.error_message = "transport already used, create a new one per connection";
            return result;
        }

        websocketpp::lib::error_code ec;
        websocketpp::uri location(options.url);
        if (!location.get_valid()) {
            result.error_message = "invalid websocket url: " + options.url;
            return result;
        }
        configure_tls(client_, location.get_host(), options.verify_ssl);

        connection_ptr con = client_.get_connection(options.url, ec);
        if (ec) {
            result.error_message = "invalid websocket url: " + ec.message();
            return result;
        }

        for (const auto& [name, value] : options.headers) {
            con->append_header(name, value);
        }
        for (const auto& subprotocol : options.subprotocols) {
            con->add_subprotocol(subprotocol, ec);
            if (ec) {
                result.error_message = "invalid subprotocol " + subprotocol + ": " + ec.message();
                return result;
            }
        }
        if (!options.proxy.empty()) {
            con->set_proxy(options.proxy, ec);
            if (ec) {
                result.error_message = "invalid proxy " + options.proxy + ": " + ec.message();
                return result;
            }
        }
        con->set_open_handshake_timeout(static_cast<long>(options.handshake_timeout.count()));

        con->set_open_handler([this](websocketpp::connection_hdl hdl) { on_open(hdl); });
        con->set_fail_handler([this](websocketpp::connection_hdl hdl) { on_fail(hdl); });
        con->set_close_handler([this](websocketpp::connection_hdl hdl) { on_close(hdl); });
        con->set_message_handler([this](websocketpp::connection_hdl, message_ptr msg) { on_message(msg); });
        con->set_pong_handler([this](websocketpp::connection_hdl, std::string) { on_pong(); });

        state_.store(WebSocketState::CONNECTING);
        hdl_ = con->get_handle();
        client_.start_perpetual();
        client_.connect(con);
        io_thread_ = std::thread(&WebsocketppConnection::run_io_thread, this);

        logger_.debug("Dialing", {{"url", options.url}});

        // The handshake timeout bounds the upgrade, the extra margin covers DNS and TCP
        auto wait_limit = options.handshake_timeout + std::chrono::seconds(5);
        std::unique_lock<std::mutex> lock(mutex_);
        bool settled = cv_.wait_for(lock, wait_limit, [this] {
            return state_.load() != WebSocketState::CONNECTING;
        });

        if (!settled) {
            lock.unlock();
            disconnect();
            result.error_message = "websocket handshake timed out";
            return result;
        }

        if (state_.load() != WebSocketState::CONNECTED) {
            result.error_message = fail_message_.empty() ? "websocket connection failed" : fail_message_;
            result.http_status = fail_status_;
            result.response_body = fail_body_;
            lock.unlock();
            disconnect();
            return result;
        }

        result.success = true;
        return result;
    }

    void disconnect() override {
        if (!io_thread_.joinable()) {
            return;
        }

        state_.store(WebSocketState::DISCONNECTING);
        client_.stop_perpetual();
        client_.stop();
        io_thread_.join();

        websocketpp::lib::error_code ec;
        connection_ptr con = client_.get_con_from_hdl(hdl_, ec);
        if (!ec && con) {
            websocketpp::lib::asio::error_code socket_ec;
            con->get_raw_socket().close(socket_ec);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            terminated_ = true;
        }
        state_.store(WebSocketState::DISCONNECTED);
        cv_.notify_all();
    }

    bool is_connected() const override {
        return state_.load() == WebSocketState::CONNECTED;
    }

    WebSocketState get_state() const override {
        return state_.load();
    }

    ReadResult read_message() override {
        ReadResult result;
        std::unique_lock<std::mutex> lock(mutex_);

        while (true) {
            if (!inbox_.empty()) {
                result.status = ReadStatus::MESSAGE;
                result.message = std::move(inbox_.front());
                inbox_.pop_front();
                return result;
            }
            if (remote_closed_) {
                result.status = ReadStatus::CLOSED;
                result.close_code = remote_close_code_;
                result.error_message = "websocket closed: " + std::to_string(remote_close_code_) +
                                       (remote_close_reason_.empty() ? "" : " " + remote_close_reason_);
                return result;
            }
            if (terminated_) {
                result.status = ReadStatus::ERROR;
                result.error_message = fail_message_.empty() ? "use of closed connection" : fail_message_;
                return result;
            }
            if (read_deadline_ != Deadline::max() && Clock::now() >= read_deadline_) {
                result.status = ReadStatus::TIMEOUT;
                result.error_message = "i/o timeout";
                return result;
            }

            if (read_deadline_ == Deadline::max()) {
                cv_.wait(lock);
            } else {
                cv_.wait_until(lock, read_deadline_);
            }
        }
    }

    void set_read_deadline(Deadline deadline) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            read_deadline_ = deadline;
        }
        cv_.notify_all();
    }

    void set_pong_handler(PongCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pong_callback_ = std::move(callback);
    }

    error_handling::Status send_text(const std::string& message, Deadline deadline) override {
        return run_write("write", deadline, [message](connection_ptr con) {
            return con->send(message, websocketpp::frame::opcode::text);
        });
    }

    error_handling::Status send_ping(Deadline deadline) override {
        return run_write("ping", deadline, [](connection_ptr con) {
            websocketpp::lib::error_code ec;
            con->ping("", ec);
            return ec;
        });
    }

    error_handling::Status send_close(uint16_t code, const std::string& reason, Deadline deadline) override {
        return run_write("close", deadline, [code, reason](connection_ptr con) {
            websocketpp::lib::error_code ec;
            con->close(code, reason, ec);
            return ec;
        });
    }

private:
    void run_io_thread() {
        try {
            client_.run();
        } catch (const std::exception& e) {
            logger_.error("I/O thread stopped with exception", {{"error", e.what()}});
            {
                std::lock_guard<std::mutex> lock(mutex_);
                fail_message_ = e.what();
                terminated_ = true;
            }
            state_.store(WebSocketState::ERROR);
            cv_.notify_all();
        }
    }

    void on_open(websocketpp::connection_hdl) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_.store(WebSocketState::CONNECTED);
        }
        cv_.notify_all();
    }

    void on_fail(websocketpp::connection_hdl hdl) {
        connection_ptr con = client_.get_con_from_hdl(hdl);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_message_ = con->get_ec().message();
            fail_status_ = static_cast<int>(con->get_response_code());
            fail_body_ = con->get_response().get_body();
            if (fail_status_ != 0) {
                fail_message_ += " (HTTP " + std::to_string(fail_status_) + ")";
            }
            terminated_ = true;
            state_.store(WebSocketState::ERROR);
        }
        cv_.notify_all();
    }

    void on_close(websocketpp::connection_hdl hdl) {
        connection_ptr con = client_.get_con_from_hdl(hdl);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            remote_closed_ = true;
            remote_close_code_ = con->get_remote_close_code();
            remote_close_reason_ = con->get_remote_close_reason();
            state_.store(WebSocketState::DISCONNECTED);
        }
        cv_.notify_all();
    }

    void on_message(message_ptr msg) {
        WebSocketMessage message;
        message.data = msg->get_payload();
        message.is_binary = msg->get_opcode() == websocketpp::frame::opcode::binary;
        message.timestamp_us = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbox_.push_back(std::move(message));
        }
        cv_.notify_all();
    }

    void on_pong() {
        PongCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = pong_callback_;
        }
        if (callback) {
            callback();
        }
    }

    error_handling::Status open_connection(const std::string& op_name, connection_ptr& con) {
        if (state_.load() != WebSocketState::CONNECTED) {
            return write_error(op_name, "websocket not connected");
        }
        websocketpp::lib::error_code ec;
        con = client_.get_con_from_hdl(hdl_, ec);
        if (ec || !con) {
            return write_error(op_name, "websocket connection gone");
        }
        return error_handling::Status::ok();
    }

    struct WriteOp {
        bool done{false};
        websocketpp::lib::error_code ec;
    };

    /**
     * Runs a write on the I/O thread so every access to the connection's
     * send queue happens there. The caller waits for the write to be
     * handed to websocketpp until the deadline.
     */
    template <typename Write>
    error_handling::Status run_write(const std::string& op_name, Deadline deadline, Write write) {
        connection_ptr con;
        error_handling::Status status = open_connection(op_name, con);
        if (status.is_error()) {
            return status;
        }

        auto op = std::make_shared<WriteOp>();
        client_.get_io_service().post([this, op, con, write]() {
            websocketpp::lib::error_code ec = write(con);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                op->ec = ec;
                op->done = true;
            }
            cv_.notify_all();
        });

        std::unique_lock<std::mutex> lock(mutex_);
        bool finished = cv_.wait_until(lock, deadline, [this, &op] { return op->done || terminated_; });
        if (!finished) {
            return write_error(op_name, "i/o timeout");
        }
        if (!op->done) {
            return write_error(op_name, "connection closed");
        }
        if (op->ec) {
            return write_error(op_name, op->ec.message());
        }
        return error_handling::Status::ok();
    }

    static error_handling::Status write_error(const std::string& op, const std::string& message) {
        return error_handling::Status::error(error_handling::ErrorCode::WRITE_FAILED, op + ": " + message);
    }

    Client client_;
    websocketpp::connection_hdl hdl_;
    std::thread io_thread_;
    std::atomic<WebSocketState> state_{WebSocketState::DISCONNECTED};
    logging::Logger logger_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WebSocketMessage> inbox_;
    Deadline read_deadline_{Deadline::max()};
    PongCallback pong_callback_;

    bool remote_closed_{false};
    uint16_t remote_close_code_{0};
    std::string remote_close_reason_;
    bool terminated_{false};
    std::string fail_message_;
    int fail_status_{0};
    std::string fail_body_;
};

/**
 * Transport returned by the factory: picks the TLS or plain websocketpp
 * client from the URL scheme on connect().
 */
class WebsocketppTransport : public IWebSocketTransport {
public:
    WebsocketppTransport() = default;
    ~WebsocketppTransport() override = default;

    DialResult connect(const DialOptions& options) override;
    void disconnect() override;
    bool is_connected() const override;
    WebSocketState get_state() const override;

    ReadResult read_message() override;
    void set_read_deadline(Deadline deadline) override;
    void set_pong_handler(PongCallback callback) override;

    error_handling::Status send_text(const std::string& message, Deadline deadline) override;
    error_handling::Status send_ping(Deadline deadline) override;
    error_handling::Status send_close(uint16_t code, const std::string& reason, Deadline deadline) override;

private:
    std::unique_ptr<IWebSocketTransport> connection_;
};

} // namespace websocket_transport
