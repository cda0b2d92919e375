#pragma once

/**
 * Standardized error handling utilities
 *
 * Provides the error taxonomy and the Result/Status return types
 * used across the listener, plus helpers for invoking user callbacks.
 */

#include <string>
#include <exception>
#include <stdexcept>
#include <functional>
#include <optional>
#include "../utils/logging/log_helper.hpp"

namespace error_handling {

enum class ErrorCode {
    NONE,
    AUTH_FAILED,            // authorization exchange failed
    CONNECT_FAILED,         // websocket dial/handshake failed
    PRECONDITION_FAILED,    // connect before authorize, listen before connect
    FRAME_DECODE_FAILED,    // malformed top-level frame, frame dropped
    PAYLOAD_DECODE_FAILED,  // malformed inner payload, degenerates to empty
    ACK_SEND_FAILED,        // acknowledgment write failed, logged only
    READ_FAILED,            // read loop fatal
    WRITE_FAILED,           // keepalive loop fatal
    CANCELLED
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::AUTH_FAILED: return "AUTH_FAILED";
        case ErrorCode::CONNECT_FAILED: return "CONNECT_FAILED";
        case ErrorCode::PRECONDITION_FAILED: return "PRECONDITION_FAILED";
        case ErrorCode::FRAME_DECODE_FAILED: return "FRAME_DECODE_FAILED";
        case ErrorCode::PAYLOAD_DECODE_FAILED: return "PAYLOAD_DECODE_FAILED";
        case ErrorCode::ACK_SEND_FAILED: return "ACK_SEND_FAILED";
        case ErrorCode::READ_FAILED: return "READ_FAILED";
        case ErrorCode::WRITE_FAILED: return "WRITE_FAILED";
        case ErrorCode::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

struct Error {
    ErrorCode code{ErrorCode::NONE};
    std::string message;
    int http_status{0};          // set for AUTH_FAILED on non-2xx responses
    std::string response_body;   // raw server body, verbatim

    std::string to_string() const {
        return std::string(error_code_to_string(code)) + ": " + message;
    }
};

/**
 * Result type for operations that can fail
 * Similar to Rust's Result<T, E> or std::expected
 */
template<typename T>
class Result {
public:
    // Success constructor
    static Result success(T value) {
        Result result;
        result.value_ = std::move(value);
        result.success_ = true;
        return result;
    }

    // Error constructors
    static Result error(Error err) {
        Result result;
        result.error_ = std::move(err);
        result.success_ = false;
        return result;
    }

    static Result error(ErrorCode code, const std::string& error_message) {
        Error err;
        err.code = code;
        err.message = error_message;
        return error(std::move(err));
    }

    // Check if operation was successful
    bool is_success() const { return success_; }
    bool is_error() const { return !success_; }

    // Get the value (only call if is_success() == true)
    const T& value() const {
        if (!success_) {
            throw std::runtime_error("Attempted to get value from error Result");
        }
        return value_.value();
    }

    T& value() {
        if (!success_) {
            throw std::runtime_error("Attempted to get value from error Result");
        }
        return value_.value();
    }

    // Get the error (only call if is_error() == true)
    const Error& error() const {
        if (success_) {
            throw std::runtime_error("Attempted to get error from success Result");
        }
        return error_;
    }

    ErrorCode code() const { return success_ ? ErrorCode::NONE : error_.code; }

    // Convenience operators
    explicit operator bool() const { return success_; }
    const T& operator*() const { return value(); }
    T& operator*() { return value(); }

private:
    std::optional<T> value_;
    Error error_;
    bool success_{false};
};

/**
 * Outcome of an operation that produces no value
 */
class Status {
public:
    static Status ok() {
        return Status();
    }

    static Status error(Error err) {
        Status status;
        status.error_ = std::move(err);
        return status;
    }

    static Status error(ErrorCode code, const std::string& error_message) {
        Error err;
        err.code = code;
        err.message = error_message;
        return error(std::move(err));
    }

    // Re-wraps the error of a failed Result
    template<typename T>
    static Status from(const Result<T>& result) {
        return result.is_success() ? ok() : error(result.error());
    }

    bool is_success() const { return error_.code == ErrorCode::NONE; }
    bool is_error() const { return !is_success(); }
    ErrorCode code() const { return error_.code; }
    const Error& error() const { return error_; }
    const std::string& message() const { return error_.message; }

    explicit operator bool() const { return is_success(); }

private:
    Error error_;
};

/**
 * Execute a callback with exception handling
 * Prevents callback exceptions from crashing the system
 *
 * @param callback Callback function to execute
 * @param logger Logger that receives the failure
 * @param operation_name Operation name for logging
 * @param args Arguments to pass to callback
 * @return true if the callback ran without throwing
 */
template<typename Callback, typename... Args>
bool safe_callback(Callback&& callback, logging::Logger& logger,
                   const std::string& operation_name, Args&&... args) {
    if (!callback) {
        return false;  // No callback set
    }

    try {
        callback(std::forward<Args>(args)...);
        return true;
    } catch (const std::exception& e) {
        logger.error("Exception in " + operation_name + " callback: " + std::string(e.what()));
    } catch (...) {
        logger.error("Unknown exception in " + operation_name + " callback");
    }
    return false;
}

} // namespace error_handling
