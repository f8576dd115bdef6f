#pragma once

#include <optional>
#include <string>

namespace lmgate {

/**
 * @brief Error categories surfaced by the gateway
 *
 * Each category maps to a distinct HTTP status at the server boundary
 * (see server/error_response.hpp).
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,       // malformed inbound payload, never queued
    QUEUE_TIMEOUT,          // deadline elapsed before admission
    BACKEND_TIMEOUT,        // deadline elapsed during the backend call
    BACKEND_UNAVAILABLE,    // connection refused / reset
    BACKEND_ERROR,          // backend answered with a non-2xx status
    CANCELLED_BY_CLIENT,    // caller went away
    SHUTTING_DOWN,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::VALIDATION_ERROR:    return "validation_error";
        case ErrorCategory::QUEUE_TIMEOUT:       return "queue_timeout";
        case ErrorCategory::BACKEND_TIMEOUT:     return "backend_timeout";
        case ErrorCategory::BACKEND_UNAVAILABLE: return "backend_unavailable";
        case ErrorCategory::BACKEND_ERROR:       return "backend_error";
        case ErrorCategory::CANCELLED_BY_CLIENT: return "cancelled_by_client";
        case ErrorCategory::SHUTTING_DOWN:       return "shutting_down";
        case ErrorCategory::INTERNAL_ERROR:      return "internal_error";
        default:                                 return "unknown";
    }
}

/**
 * @brief Classified failure. upstream_* are only set for BACKEND_ERROR.
 */
struct Error {
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;
    int upstream_status = 0;
    std::string upstream_body;
    std::string upstream_content_type;
};

/**
 * @brief {"error":{"type":...,"message":...}} body for a gateway-side error
 */
[[nodiscard]] std::string error_to_json(const Error& err);

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_.category = category;
        r.error_.message = std::move(message);
        return r;
    }

    static Result error(Error err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const Error& error_info() const { return error_; }
    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }

private:
    bool success_ = false;
    std::optional<T> value_;
    Error error_;
};

} // namespace lmgate
