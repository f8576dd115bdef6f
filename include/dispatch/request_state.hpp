#pragma once

#include <cstdint>

namespace lmgate {

/**
 * @brief Lifecycle of one chat-completion request
 *
 * ARRIVED → QUEUED → ADMITTED → CALLING → {COMPLETED | FAILED | TIMED_OUT | CANCELLED}
 *
 * FAILED is also reachable straight from ARRIVED (validation, shutdown),
 * TIMED_OUT and CANCELLED straight from QUEUED.
 */
enum class RequestState : uint8_t {
    ARRIVED,
    QUEUED,
    ADMITTED,
    CALLING,
    COMPLETED,
    FAILED,
    TIMED_OUT,
    CANCELLED
};

[[nodiscard]] inline const char* request_state_to_string(RequestState state) {
    switch (state) {
        case RequestState::ARRIVED:   return "arrived";
        case RequestState::QUEUED:    return "queued";
        case RequestState::ADMITTED:  return "admitted";
        case RequestState::CALLING:   return "calling";
        case RequestState::COMPLETED: return "completed";
        case RequestState::FAILED:    return "failed";
        case RequestState::TIMED_OUT: return "timed_out";
        case RequestState::CANCELLED: return "cancelled";
        default:                      return "unknown";
    }
}

[[nodiscard]] constexpr bool is_terminal(RequestState state) {
    return state == RequestState::COMPLETED || state == RequestState::FAILED ||
           state == RequestState::TIMED_OUT || state == RequestState::CANCELLED;
}

} // namespace lmgate
