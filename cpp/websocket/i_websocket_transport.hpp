#pragma once
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <memory>
#include <chrono>
#include <cstdint>
#include "../utils/error_handling.hpp"

namespace websocket_transport {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

// RFC 6455 close codes used by the listener
constexpr uint16_t CLOSE_NORMAL = 1000;
constexpr uint16_t CLOSE_NO_STATUS = 1005;
constexpr uint16_t CLOSE_ABNORMAL = 1006;

// WebSocket message structure
struct WebSocketMessage {
    std::string data;
    bool is_binary{false};
    uint64_t timestamp_us{0};
};

// WebSocket connection states
enum class WebSocketState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    DISCONNECTING,
    ERROR
};

// Everything needed to open one connection
struct DialOptions {
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<std::string> subprotocols;
    std::chrono::milliseconds handshake_timeout{10000};
    std::string proxy;            // empty for a direct connection
    bool verify_ssl{true};
};

struct DialResult {
    bool success{false};
    std::string error_message;
    int http_status{0};           // upgrade response status, 0 if none was received
    std::string response_body;    // server rejection reason, if any
};

enum class ReadStatus {
    MESSAGE,
    TIMEOUT,    // read deadline passed
    CLOSED,     // close frame received, see close_code
    ERROR       // transport failure or local close
};

struct ReadResult {
    ReadStatus status{ReadStatus::ERROR};
    WebSocketMessage message;
    uint16_t close_code{0};
    std::string error_message;
};

using PongCallback = std::function<void()>;

/**
 * Blocking WebSocket connection.
 *
 * One connection per instance. read_message() must only be called by a
 * single reader; the send_* methods are not synchronized against each
 * other, callers serialize writes.
 */
class IWebSocketTransport {
public:
    virtual ~IWebSocketTransport() = default;

    // Connection management
    virtual DialResult connect(const DialOptions& options) = 0;
    virtual void disconnect() = 0;                 // forced close, unblocks the reader
    virtual bool is_connected() const = 0;
    virtual WebSocketState get_state() const = 0;

    // Read side
    virtual ReadResult read_message() = 0;         // blocks until message, close, error or deadline
    virtual void set_read_deadline(Deadline deadline) = 0;
    virtual void set_pong_handler(PongCallback callback) = 0;

    // Write side
    virtual error_handling::Status send_text(const std::string& message, Deadline deadline) = 0;
    virtual error_handling::Status send_ping(Deadline deadline) = 0;
    virtual error_handling::Status send_close(uint16_t code, const std::string& reason, Deadline deadline) = 0;
};

using TransportFactory = std::function<std::unique_ptr<IWebSocketTransport>()>;

} // namespace websocket_transport
