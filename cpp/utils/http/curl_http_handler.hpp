#pragma once
#include "i_http_handler.hpp"
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>
#include <curl/curl.h>

// CURL-based HTTP handler implementation
class CurlHttpHandler : public IHttpHandler {
public:
    CurlHttpHandler();
    ~CurlHttpHandler() override;

    HttpResponse make_request(const HttpRequest& request) override;

    bool initialize() override;
    void shutdown() override;
    bool is_initialized() const override { return initialized_; }

    void set_default_timeout(int timeout_ms) override { default_timeout_ms_ = timeout_ms; }

    // application/x-www-form-urlencoded body, keys and values escaped
    std::string encode_form(const std::vector<std::pair<std::string, std::string>>& fields);

private:
    struct WriteCallbackData {
        std::string* buffer;
        HttpResponse* response;
    };

    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data);
    static size_t HeaderCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data);

    void setup_curl_options(CURL* curl, const HttpRequest& request, const std::string& body, WriteCallbackData& data);
    std::string escape(const std::string& value);

    bool initialized_{false};
    int default_timeout_ms_{30000};

    CURL* curl_{nullptr};
    // One easy handle, requests are serialized
    std::mutex curl_mutex_;
};
