#pragma once

#include "backend/chunk_stream.hpp"
#include "core/error.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace lmgate {

struct BackendReply {
    int status = 0;
    std::string body;
    std::string content_type;
};

struct ForwardRequest {
    std::string method;
    std::string target;         // path + query, e.g. "/v1/embeddings"
    std::string body;
    std::string content_type;
    std::chrono::milliseconds timeout{0};
};

/**
 * @brief Interface for talking to the inference backend
 *
 * call() is the admission-gated path; forward() and fetch() are not gated.
 */
class IBackendClient {
public:
    virtual ~IBackendClient() = default;

    /**
     * @brief Start a chat-completion call. The result is read lazily.
     *
     * Buffered and streamed calls use the same stream; a buffered caller
     * simply concatenates CHUNK events.
     */
    [[nodiscard]] virtual std::unique_ptr<IChunkStream> call(const UpstreamCall& call) = 0;

    /**
     * @brief Verbatim pass-through. Any status the backend returns is a success.
     */
    [[nodiscard]] virtual Result<BackendReply> forward(const ForwardRequest& request) = 0;

    /**
     * @brief Plain GET with a short timeout (health probe, model listing)
     */
    [[nodiscard]] virtual Result<BackendReply> fetch(const std::string& path,
                                                     std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual const std::string& base_url() const = 0;
};

// ============================================================================
// Backend inspection helpers (built on fetch())
// ============================================================================

struct BackendHealth {
    bool reachable = false;
    std::string body;       // backend /health body when reachable
    std::string error;
};

[[nodiscard]] BackendHealth check_backend_health(IBackendClient& client,
                                                 std::chrono::milliseconds timeout);

/**
 * @brief JSON body for GET /v1/models
 *
 * Backend's own answer when it is reachable, otherwise a static list with
 * the configured default model.
 */
[[nodiscard]] BackendReply list_backend_models(IBackendClient& client,
                                               std::chrono::milliseconds timeout,
                                               const std::string& default_model);

/**
 * @brief Render a BackendHealth as the {"status":...} JSON object
 */
[[nodiscard]] std::string backend_health_to_json(const BackendHealth& health);

} // namespace lmgate
