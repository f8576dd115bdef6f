#pragma once

#include "admission/request_queue.hpp"
#include "admission/slot_lease.hpp"
#include "backend/ibackend_client.hpp"
#include "core/error.hpp"
#include "dispatch/request_state.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace lmgate {

/**
 * @brief Validated chat-completion request, ready to forward
 */
struct ChatPayload {
    std::string body;       // normalized JSON: nulls dropped, model filled in
    std::string model;
    bool streaming = false;
};

/**
 * @brief Validate an OpenAI chat-completion body and normalize it
 *
 * Accepts a JSON object whose "messages" is an array of {role, content}
 * string pairs. model must be a string, temperature/top_p numbers,
 * max_tokens an integer (each may also be null), stream a boolean.
 * Unknown fields pass through. Top-level nulls are dropped and a missing
 * or empty model becomes default_model.
 */
[[nodiscard]] Result<ChatPayload> normalize_chat_payload(const std::string& body,
                                                         const std::string& default_model);

/**
 * @brief Whole backend answer for a non-streaming call
 */
struct Completion {
    int status = 200;
    std::string body;
    std::string content_type;
};

class Dispatcher;

/**
 * @brief A streaming call that has been admitted and answered 2xx
 *
 * Owns the slot lease and the backend stream. The slot stays held until
 * pump() reaches a terminal state or the session is destroyed, whichever
 * comes first. Must not outlive the Dispatcher that opened it.
 */
class RelaySession {
public:
    // Writes bytes to the caller; false once the caller is gone
    using Sink = std::function<bool(std::string_view)>;

    // Constructor access token; only Dispatcher can create one
    class Key {
        friend class Dispatcher;
        Key() = default;
    };

    RelaySession(Key key,
                 Dispatcher& owner,
                 SlotLease lease,
                 std::unique_ptr<IChunkStream> stream,
                 uint64_t sequence,
                 int status,
                 std::string content_type,
                 std::chrono::steady_clock::time_point deadline,
                 std::chrono::steady_clock::time_point call_start);
    ~RelaySession();

    RelaySession(const RelaySession&) = delete;
    RelaySession& operator=(const RelaySession&) = delete;

    /**
     * @brief Relay every remaining backend chunk, in order, to sink.
     *
     * A backend failure or deadline after the stream started is written as
     * a final SSE `data: {"error":...}` event. Returns the terminal state;
     * calling again after that returns the same state without I/O.
     */
    RequestState pump(const Sink& sink, const RequestQueue::DisconnectProbe& probe = {});

    [[nodiscard]] int status() const { return status_; }
    [[nodiscard]] const std::string& content_type() const { return content_type_; }
    [[nodiscard]] uint64_t sequence() const { return sequence_; }
    [[nodiscard]] bool finished() const { return finished_; }

private:
    friend class Dispatcher;

    RequestState finish(RequestState state, const Error* error);

    Dispatcher& owner_;
    SlotLease lease_;
    std::unique_ptr<IChunkStream> stream_;
    const uint64_t sequence_;
    const int status_;
    const std::string content_type_;
    const std::chrono::steady_clock::time_point deadline_;
    const std::chrono::steady_clock::time_point call_start_;
    RequestState state_ = RequestState::CALLING;
    bool finished_ = false;
};

/**
 * @brief Drives one request through admission and the backend call
 *
 * Every request that enters complete() or open_stream() reaches exactly one
 * terminal state, and the slot it was admitted with is released exactly once.
 * Thread-safe: one handler thread per in-flight request.
 */
class Dispatcher {
public:
    struct Config {
        std::chrono::milliseconds request_timeout{300'000};    // queue wait + backend call
        std::string default_model = "gpt-oss-20b";
        std::chrono::milliseconds disconnect_poll{100};       // probe cadence while calling
        std::chrono::milliseconds queue_wait_log_threshold{100};
    };

    Dispatcher(std::shared_ptr<RequestQueue> queue,
               std::shared_ptr<IBackendClient> backend,
               Config config);

    /**
     * @brief Validate and normalize; a failure counts as a rejected request
     */
    [[nodiscard]] Result<ChatPayload> prepare(const std::string& body);

    /**
     * @brief Buffered call: queue, call, read the whole body
     *
     * A non-2xx backend answer comes back as BACKEND_ERROR carrying the
     * backend's status, body and content type.
     */
    [[nodiscard]] Result<Completion> complete(
        const ChatPayload& payload,
        std::chrono::steady_clock::time_point arrival,
        const RequestQueue::DisconnectProbe& probe = {});

    /**
     * @brief Streaming call: queue, call, wait for the backend's status line
     *
     * Errors before the first byte is relayed come back as a Result error,
     * exactly as for complete(). Afterwards the returned session owns the slot.
     */
    [[nodiscard]] Result<std::unique_ptr<RelaySession>> open_stream(
        const ChatPayload& payload,
        std::chrono::steady_clock::time_point arrival,
        const RequestQueue::DisconnectProbe& probe = {});

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const RequestQueue& queue() const { return *queue_; }

    struct Stats {
        uint64_t completed;
        uint64_t failed;
        uint64_t rejected;              // failed before queueing (validation, shutdown)
        uint64_t timed_out_queued;
        uint64_t timed_out_calling;
        uint64_t cancelled;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    friend class RelaySession;

    // Admitted call whose status line has arrived
    struct StartedCall {
        SlotLease lease;
        std::unique_ptr<IChunkStream> stream;
        uint64_t sequence = 0;
        int status = 0;
        std::string content_type;
        std::chrono::steady_clock::time_point deadline;
        std::chrono::steady_clock::time_point call_start;
    };

    [[nodiscard]] Result<StartedCall> start(const ChatPayload& payload,
                                            std::chrono::steady_clock::time_point arrival,
                                            const RequestQueue::DisconnectProbe& probe);

    /**
     * @brief Read the rest of a started call's body, stopping at the deadline
     * or when the caller disconnects
     */
    [[nodiscard]] Result<std::string> read_body(StartedCall& call,
                                                const RequestQueue::DisconnectProbe& probe);

    // Terminal bookkeeping; error is null for COMPLETED
    void record(RequestState state, uint64_t sequence, const Error* error);

    std::shared_ptr<RequestQueue> queue_;
    std::shared_ptr<IBackendClient> backend_;
    const Config config_;

    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> timed_out_queued_{0};
    std::atomic<uint64_t> timed_out_calling_{0};
    std::atomic<uint64_t> cancelled_{0};
};

} // namespace lmgate
