#pragma once
#include <string>
#include <map>
#include <memory>
#include <utility>
#include <vector>

// HTTP request structure
struct HttpRequest {
    std::string method;           // GET, POST, PUT, DELETE
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    // Encoded as application/x-www-form-urlencoded when body is empty.
    // Repeated keys are kept in order.
    std::vector<std::pair<std::string, std::string>> form_fields;
    int timeout_ms{0};            // 0 uses the handler default
    bool verify_ssl{true};
};

// HTTP response structure
struct HttpResponse {
    int status_code{0};
    std::map<std::string, std::string> headers;
    std::string body;
    std::string error_message;    // transport level failure, status_code stays 0
    bool success{false};          // 2xx
};

// Base interface for HTTP handlers
class IHttpHandler {
public:
    virtual ~IHttpHandler() = default;

    // Synchronous HTTP request
    virtual HttpResponse make_request(const HttpRequest& request) = 0;

    // Lifecycle management
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;

    // Configuration
    virtual void set_default_timeout(int timeout_ms) = 0;
};

// HTTP handler factory
class HttpHandlerFactory {
public:
    enum class Type {
        CURL
    };

    static std::unique_ptr<IHttpHandler> create(Type type = Type::CURL);
};
