#include "server/error_response.hpp"
#include "server/http_constants.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

namespace lmgate {

int http_status_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::VALIDATION_ERROR:    return 422;
        case ErrorCategory::QUEUE_TIMEOUT:       return 503;
        case ErrorCategory::BACKEND_TIMEOUT:     return 504;
        case ErrorCategory::BACKEND_UNAVAILABLE: return 502;
        case ErrorCategory::BACKEND_ERROR:       return 502;   // only without an upstream status
        case ErrorCategory::CANCELLED_BY_CLIENT: return http::kClientClosedRequest;
        case ErrorCategory::SHUTTING_DOWN:       return 503;
        case ErrorCategory::INTERNAL_ERROR:
        case ErrorCategory::NONE:
        default:                                 return 500;
    }
}

ErrorResponse make_error_response(const Error& error, std::chrono::seconds retry_after) {
    ErrorResponse response;

    if (error.category == ErrorCategory::BACKEND_ERROR && error.upstream_status > 0) {
        response.status = error.upstream_status;
        response.body = error.upstream_body;
        response.content_type = error.upstream_content_type.empty()
            ? std::string(http::kJsonContentType) : error.upstream_content_type;
        return response;
    }

    response.status = http_status_for(error.category);
    response.body = error_to_json(error);
    response.content_type = http::kJsonContentType;
    if (error.category == ErrorCategory::QUEUE_TIMEOUT ||
        error.category == ErrorCategory::SHUTTING_DOWN) {
        response.retry_after = std::to_string(std::max<int64_t>(retry_after.count(), 1));
    }
    return response;
}

} // namespace lmgate
