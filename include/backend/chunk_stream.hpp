#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace lmgate {

/**
 * @brief One dispatch to the backend. Created at admission, dropped when
 * the call resolves.
 */
struct UpstreamCall {
    std::string path = "/v1/chat/completions";
    std::string payload;
    bool streaming = false;
    std::chrono::steady_clock::time_point deadline;
    std::chrono::milliseconds timeout{0};   // remaining budget when the call starts
};

struct StreamEvent {
    enum class Kind : uint8_t {
        HEAD,       // status line + headers arrived
        CHUNK,      // body bytes, in arrival order
        END,        // body complete
        PENDING,    // nothing new before the requested time
        FAILED      // transport failure; see error
    };

    Kind kind = Kind::PENDING;
    int status = 0;
    std::string content_type;
    std::string data;
    Error error;
};

/**
 * @brief Lazy, finite, non-restartable sequence of backend response events
 *
 * Yields exactly one HEAD (unless FAILED first), then CHUNKs, then END.
 * FAILED and END are terminal. The consumer must drain to a terminal event
 * or call abort(); destroying the stream aborts it and closes the backend
 * connection.
 */
class IChunkStream {
public:
    virtual ~IChunkStream() = default;

    /**
     * @brief Next event, or PENDING if none arrives before `until`
     */
    [[nodiscard]] virtual StreamEvent next(std::chrono::steady_clock::time_point until) = 0;

    /**
     * @brief Stop reading and drop the backend connection. Idempotent.
     */
    virtual void abort() = 0;
};

} // namespace lmgate
