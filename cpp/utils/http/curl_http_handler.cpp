#include "curl_http_handler.hpp"
#include "../logging/log_helper.hpp"
#include <atomic>
#include <stdexcept>

// CURL global state management with reference counting
namespace {
    std::mutex curl_init_mutex;
    std::atomic<int> curl_ref_count{0};

    void ensure_curl_initialized() {
        std::lock_guard<std::mutex> lock(curl_init_mutex);
        if (curl_ref_count.fetch_add(1) == 0) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }
    }

    void ensure_curl_cleanup() {
        std::lock_guard<std::mutex> lock(curl_init_mutex);
        if (curl_ref_count.fetch_sub(1) == 1) {
            curl_global_cleanup();
        }
    }
}

std::unique_ptr<IHttpHandler> HttpHandlerFactory::create(HttpHandlerFactory::Type type) {
    switch (type) {
        case HttpHandlerFactory::Type::CURL:
            return std::make_unique<CurlHttpHandler>();
        default:
            throw std::runtime_error("Unknown HTTP handler type");
    }
}

CurlHttpHandler::CurlHttpHandler() {
    ensure_curl_initialized();
    curl_ = curl_easy_init();
    if (!curl_) {
        ensure_curl_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpHandler::~CurlHttpHandler() {
    shutdown();
    ensure_curl_cleanup();
}

bool CurlHttpHandler::initialize() {
    std::lock_guard<std::mutex> lock(curl_mutex_);
    if (!curl_) {
        curl_ = curl_easy_init();
        if (!curl_) {
            return false;
        }
    }

    initialized_ = true;
    return true;
}

void CurlHttpHandler::shutdown() {
    std::lock_guard<std::mutex> lock(curl_mutex_);
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    initialized_ = false;
}

HttpResponse CurlHttpHandler::make_request(const HttpRequest& request) {
    HttpResponse response;

    std::lock_guard<std::mutex> lock(curl_mutex_);
    if (!initialized_ || !curl_) {
        response.error_message = "HTTP handler not initialized";
        return response;
    }

    std::string body = request.body;
    if (body.empty() && !request.form_fields.empty()) {
        body = encode_form(request.form_fields);
    }

    WriteCallbackData data;
    data.buffer = &response.body;
    data.response = &response;

    curl_easy_reset(curl_);

    // Headers
    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    setup_curl_options(curl_, request, body, data);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        response.error_message = "CURL error: " + std::string(curl_easy_strerror(res));
        LOG_DEBUG_COMP("HTTP", request.method + " " + request.url + " failed: " + response.error_message);
        return response;
    }

    long response_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = static_cast<int>(response_code);
    response.success = (response_code >= 200 && response_code < 300);

    LOG_DEBUG_COMP("HTTP", request.method + " " + request.url + " -> " + std::to_string(response.status_code));
    return response;
}

std::string CurlHttpHandler::encode_form(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string encoded;
    for (const auto& [key, value] : fields) {
        if (!encoded.empty()) {
            encoded += "&";
        }
        encoded += escape(key) + "=" + escape(value);
    }
    return encoded;
}

std::string CurlHttpHandler::escape(const std::string& value) {
    char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.length()));
    if (!escaped) {
        throw std::runtime_error("Failed to URL-encode form value");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

void CurlHttpHandler::setup_curl_options(CURL* curl, const HttpRequest& request, const std::string& body, WriteCallbackData& data) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));
    } else if (request.method == "PUT") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));
    } else if (request.method == "DELETE") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    long timeout = request.timeout_ms > 0 ? request.timeout_ms : default_timeout_ms_;
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &data);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &data);
}

size_t CurlHttpHandler::WriteCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data) {
    if (!data || !data->buffer) return 0;

    size_t total_size = size * nmemb;
    data->buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CurlHttpHandler::HeaderCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data) {
    if (!data || !data->response) return 0;

    size_t total_size = size * nmemb;
    std::string header_line(static_cast<char*>(contents), total_size);

    // Remove trailing newline
    if (!header_line.empty() && header_line.back() == '\n') {
        header_line.pop_back();
    }
    if (!header_line.empty() && header_line.back() == '\r') {
        header_line.pop_back();
    }

    // Parse header (format: "Key: Value")
    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        // Trim whitespace
        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);

        data->response->headers[key] = value;
    }

    return total_size;
}
