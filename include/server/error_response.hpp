#pragma once

#include "core/error.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace lmgate {

/**
 * @brief HTTP rendition of a classified Error
 *
 * BACKEND_ERROR forwards the backend's status, body and content type
 * unchanged; every other category gets a {"error":{"type","message"}} body.
 */
struct ErrorResponse {
    int status = 500;
    std::string body;
    std::string content_type;
    std::optional<std::string> retry_after;     // Retry-After header value
};

[[nodiscard]] int http_status_for(ErrorCategory category);

[[nodiscard]] ErrorResponse make_error_response(const Error& error,
                                                std::chrono::seconds retry_after);

} // namespace lmgate
