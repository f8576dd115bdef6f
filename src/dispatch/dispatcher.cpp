#include "dispatch/dispatcher.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace lmgate {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kLoggedBodyLimit = 512;

[[nodiscard]] bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

[[nodiscard]] double seconds_between(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

[[nodiscard]] std::string sse_error_event(const Error& error) {
    return std::format("data: {}\n\n", error_to_json(error));
}

[[nodiscard]] Error backend_deadline_error(std::chrono::milliseconds budget) {
    return {ErrorCategory::BACKEND_TIMEOUT,
            std::format("backend did not finish within the {}s request timeout",
                        std::chrono::duration<double>(budget).count()),
            0, "", ""};
}

[[nodiscard]] Error client_gone_error() {
    return {ErrorCategory::CANCELLED_BY_CLIENT, "client disconnected", 0, "", ""};
}

/**
 * @brief Next non-PENDING event from a backend stream
 *
 * Waits in slices of `slice` so the disconnect probe is consulted while
 * the backend is silent. On deadline or disconnect returns PENDING and sets
 * `interrupted` to TIMED_OUT or CANCELLED.
 */
StreamEvent pull_event(IChunkStream& stream,
                       Clock::time_point deadline,
                       const RequestQueue::DisconnectProbe& probe,
                       std::chrono::milliseconds slice,
                       RequestState& interrupted) {
    for (;;) {
        const auto now = Clock::now();
        if (now >= deadline) {
            interrupted = RequestState::TIMED_OUT;
            return {};
        }
        if (probe && probe()) {
            interrupted = RequestState::CANCELLED;
            return {};
        }
        const auto until = probe ? std::min(deadline, now + slice) : deadline;
        StreamEvent event = stream.next(until);
        if (event.kind != StreamEvent::Kind::PENDING) {
            return event;
        }
    }
}

// ============================================================================
// Payload validation
// ============================================================================

[[nodiscard]] std::optional<std::string> check_messages(const JsonValue& messages) {
    if (!messages.is_array()) {
        return "'messages' must be an array";
    }
    for (size_t i = 0; i < messages.size(); ++i) {
        const JsonValue msg = messages[i];
        if (!msg.is_object()) {
            return std::format("messages[{}] must be an object", i);
        }
        if (!msg["role"].is_string()) {
            return std::format("messages[{}].role must be a string", i);
        }
        if (!msg["content"].is_string()) {
            return std::format("messages[{}].content must be a string", i);
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<std::string> check_optional_fields(const JsonValue& root) {
    const JsonValue model = root["model"];
    if (!model.is_null() && !model.is_string()) {
        return "'model' must be a string";
    }
    for (const char* key : {"temperature", "top_p"}) {
        const JsonValue v = root[key];
        if (!v.is_null() && !v.is_number()) {
            return std::format("'{}' must be a number", key);
        }
    }
    const JsonValue max_tokens = root["max_tokens"];
    if (!max_tokens.is_null() && !max_tokens.is_number_integer()) {
        return "'max_tokens' must be an integer";
    }
    if (root.contains("stream") && !root["stream"].is_boolean()) {
        return "'stream' must be a boolean";
    }
    return std::nullopt;
}

} // anonymous namespace

Result<ChatPayload> normalize_chat_payload(const std::string& body,
                                           const std::string& default_model) {
    JsonValue root;
    try {
        root = JsonValue::parse(body);
    } catch (const JsonValue::parse_error& e) {
        return Result<ChatPayload>::error(ErrorCategory::VALIDATION_ERROR, e.what());
    }

    if (!root.is_object()) {
        return Result<ChatPayload>::error(ErrorCategory::VALIDATION_ERROR,
            "request body must be a JSON object");
    }
    if (!root.contains("messages")) {
        return Result<ChatPayload>::error(ErrorCategory::VALIDATION_ERROR,
            "'messages' is required");
    }
    if (auto problem = check_messages(root["messages"])) {
        return Result<ChatPayload>::error(ErrorCategory::VALIDATION_ERROR, std::move(*problem));
    }
    if (auto problem = check_optional_fields(root)) {
        return Result<ChatPayload>::error(ErrorCategory::VALIDATION_ERROR, std::move(*problem));
    }

    ChatPayload payload;
    payload.streaming = root.value("stream", false);
    payload.model = root.value("model", std::string{});
    if (payload.model.empty()) {
        payload.model = default_model;
    }

    // Rebuild from the source text so extra fields pass through untouched
    RawMembers members;
    try {
        members = parse_raw_members(body);
    } catch (const JsonValue::parse_error& e) {
        return Result<ChatPayload>::error(ErrorCategory::VALIDATION_ERROR, e.what());
    }
    std::erase_if(members, [](const auto& kv) { return utils::trim(kv.second.str) == "null"; });
    members["model"] = raw_member(std::format("\"{}\"", utils::escape_json(payload.model)));
    members["stream"] = raw_member(payload.streaming ? "true" : "false");

    payload.body = dump_raw_members(members);
    return Result<ChatPayload>::ok(std::move(payload));
}

// ============================================================================
// RelaySession
// ============================================================================

RelaySession::RelaySession(Key /*key*/,
                           Dispatcher& owner,
                           SlotLease lease,
                           std::unique_ptr<IChunkStream> stream,
                           uint64_t sequence,
                           int status,
                           std::string content_type,
                           Clock::time_point deadline,
                           Clock::time_point call_start)
    : owner_(owner),
      lease_(std::move(lease)),
      stream_(std::move(stream)),
      sequence_(sequence),
      status_(status),
      content_type_(std::move(content_type)),
      deadline_(deadline),
      call_start_(call_start) {}

RelaySession::~RelaySession() {
    if (finished_) return;
    // Dropped before the relay finished: the caller never took the stream
    stream_->abort();
    stream_.reset();
    lease_ = SlotLease{};
    const Error gone = client_gone_error();
    owner_.record(RequestState::CANCELLED, sequence_, &gone);
}

RequestState RelaySession::pump(const Sink& sink, const RequestQueue::DisconnectProbe& probe) {
    if (finished_) {
        return state_;
    }

    for (;;) {
        RequestState interrupted = RequestState::CALLING;
        StreamEvent event = pull_event(*stream_, deadline_, probe,
                                       owner_.config_.disconnect_poll, interrupted);

        if (interrupted == RequestState::TIMED_OUT) {
            const Error error = backend_deadline_error(owner_.config_.request_timeout);
            (void)sink(sse_error_event(error));
            return finish(RequestState::TIMED_OUT, &error);
        }
        if (interrupted == RequestState::CANCELLED) {
            const Error error = client_gone_error();
            return finish(RequestState::CANCELLED, &error);
        }

        switch (event.kind) {
            case StreamEvent::Kind::CHUNK:
                if (!sink(event.data)) {
                    const Error error = client_gone_error();
                    return finish(RequestState::CANCELLED, &error);
                }
                break;

            case StreamEvent::Kind::END:
                return finish(RequestState::COMPLETED, nullptr);

            case StreamEvent::Kind::FAILED:
                if (event.error.category == ErrorCategory::CANCELLED_BY_CLIENT) {
                    return finish(RequestState::CANCELLED, &event.error);
                }
                (void)sink(sse_error_event(event.error));
                return finish(event.error.category == ErrorCategory::BACKEND_TIMEOUT
                                  ? RequestState::TIMED_OUT : RequestState::FAILED,
                              &event.error);

            case StreamEvent::Kind::HEAD:
            case StreamEvent::Kind::PENDING:
                break;
        }
    }
}

RequestState RelaySession::finish(RequestState state, const Error* error) {
    if (state != RequestState::COMPLETED) {
        stream_->abort();
    }
    finished_ = true;
    state_ = state;
    stream_.reset();
    lease_.release();
    if (state == RequestState::COMPLETED) {
        utils::log::debug(std::format("Request #{} stream completed in {:.2f}s",
            sequence_, seconds_between(call_start_, Clock::now())));
    }
    owner_.record(state, sequence_, error);
    return state;
}

// ============================================================================
// Dispatcher
// ============================================================================

Dispatcher::Dispatcher(std::shared_ptr<RequestQueue> queue,
                       std::shared_ptr<IBackendClient> backend,
                       Config config)
    : queue_(std::move(queue)),
      backend_(std::move(backend)),
      config_(std::move(config)) {
    if (!queue_ || !backend_) {
        throw std::invalid_argument("Dispatcher requires a RequestQueue and a backend client");
    }
    if (config_.request_timeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Dispatcher request_timeout must be positive");
    }
}

Result<ChatPayload> Dispatcher::prepare(const std::string& body) {
    auto result = normalize_chat_payload(body, config_.default_model);
    if (result.is_error()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Rejected chat request: {}", result.error_message()));
    }
    return result;
}

Result<Dispatcher::StartedCall> Dispatcher::start(const ChatPayload& payload,
                                                  Clock::time_point arrival,
                                                  const RequestQueue::DisconnectProbe& probe) {
    if (queue_->is_closed()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return Result<StartedCall>::error(ErrorCategory::SHUTTING_DOWN,
            "gateway is shutting down");
    }

    // ARRIVED → QUEUED
    const auto deadline = arrival + config_.request_timeout;
    auto acquisition = queue_->acquire_blocking(deadline, probe);
    const uint64_t seq = acquisition.sequence;

    switch (acquisition.outcome) {
        case WaitOutcome::TIMED_OUT: {
            Error error{ErrorCategory::QUEUE_TIMEOUT,
                std::format("no backend slot became free within {}s",
                            std::chrono::duration<double>(config_.request_timeout).count()),
                0, "", ""};
            record(RequestState::TIMED_OUT, seq, &error);
            return Result<StartedCall>::error(std::move(error));
        }
        case WaitOutcome::CANCELLED: {
            if (queue_->is_closed()) {
                rejected_.fetch_add(1, std::memory_order_relaxed);
                return Result<StartedCall>::error(ErrorCategory::SHUTTING_DOWN,
                    "gateway is shutting down");
            }
            Error error = client_gone_error();
            record(RequestState::CANCELLED, seq, &error);
            return Result<StartedCall>::error(std::move(error));
        }
        case WaitOutcome::ADMITTED:
            break;
    }

    // ADMITTED
    if (acquisition.waited > config_.queue_wait_log_threshold) {
        utils::log::info(std::format("Request #{} queued for {:.2f}s before processing",
            seq, std::chrono::duration<double>(acquisition.waited).count()));
    }

    StartedCall started;
    started.lease = std::move(acquisition.lease);
    started.sequence = seq;
    started.deadline = deadline;
    started.call_start = Clock::now();

    const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
        deadline - started.call_start);
    if (remaining <= std::chrono::milliseconds::zero()) {
        Error error = backend_deadline_error(config_.request_timeout);
        record(RequestState::TIMED_OUT, seq, &error);
        return Result<StartedCall>::error(std::move(error));
    }

    // CALLING
    UpstreamCall call;
    call.payload = payload.body;
    call.streaming = payload.streaming;
    call.deadline = deadline;
    call.timeout = remaining;

    try {
        started.stream = backend_->call(call);
    } catch (const std::exception& e) {
        Error error{ErrorCategory::INTERNAL_ERROR,
            std::format("could not start backend call: {}", e.what()), 0, "", ""};
        record(RequestState::FAILED, seq, &error);
        return Result<StartedCall>::error(std::move(error));
    }

    RequestState interrupted = RequestState::CALLING;
    StreamEvent head = pull_event(*started.stream, deadline, probe,
                                  config_.disconnect_poll, interrupted);
    if (interrupted == RequestState::TIMED_OUT) {
        started.stream->abort();
        Error error = backend_deadline_error(config_.request_timeout);
        record(RequestState::TIMED_OUT, seq, &error);
        return Result<StartedCall>::error(std::move(error));
    }
    if (interrupted == RequestState::CANCELLED) {
        started.stream->abort();
        Error error = client_gone_error();
        record(RequestState::CANCELLED, seq, &error);
        return Result<StartedCall>::error(std::move(error));
    }

    switch (head.kind) {
        case StreamEvent::Kind::HEAD:
            break;
        case StreamEvent::Kind::FAILED: {
            const RequestState state =
                head.error.category == ErrorCategory::BACKEND_TIMEOUT ? RequestState::TIMED_OUT
                : head.error.category == ErrorCategory::CANCELLED_BY_CLIENT ? RequestState::CANCELLED
                : RequestState::FAILED;
            record(state, seq, &head.error);
            return Result<StartedCall>::error(std::move(head.error));
        }
        default: {
            started.stream->abort();
            Error error{ErrorCategory::INTERNAL_ERROR,
                "backend stream produced data before its status line", 0, "", ""};
            record(RequestState::FAILED, seq, &error);
            return Result<StartedCall>::error(std::move(error));
        }
    }

    started.status = head.status;
    started.content_type = std::move(head.content_type);

    if (!is_success_status(started.status)) {
        auto body = read_body(started, probe);
        if (body.is_error()) {
            return Result<StartedCall>::error(body.error_info());
        }
        Error error{ErrorCategory::BACKEND_ERROR,
            std::format("backend returned HTTP {}", started.status),
            started.status, std::move(body.value()), started.content_type};
        utils::log::error(std::format("Backend error for request #{}: {} - {}",
            seq, started.status, error.upstream_body.substr(0, kLoggedBodyLimit)));
        record(RequestState::FAILED, seq, &error);
        return Result<StartedCall>::error(std::move(error));
    }

    return Result<StartedCall>::ok(std::move(started));
}

Result<std::string> Dispatcher::read_body(StartedCall& call,
                                          const RequestQueue::DisconnectProbe& probe) {
    std::string body;
    for (;;) {
        RequestState interrupted = RequestState::CALLING;
        StreamEvent event = pull_event(*call.stream, call.deadline, probe,
                                       config_.disconnect_poll, interrupted);
        if (interrupted != RequestState::CALLING) {
            call.stream->abort();
            Error error = interrupted == RequestState::TIMED_OUT
                ? backend_deadline_error(config_.request_timeout)
                : client_gone_error();
            record(interrupted, call.sequence, &error);
            return Result<std::string>::error(std::move(error));
        }

        switch (event.kind) {
            case StreamEvent::Kind::CHUNK:
                body += event.data;
                break;
            case StreamEvent::Kind::END:
                return Result<std::string>::ok(std::move(body));
            case StreamEvent::Kind::FAILED: {
                const RequestState state =
                    event.error.category == ErrorCategory::BACKEND_TIMEOUT ? RequestState::TIMED_OUT
                    : event.error.category == ErrorCategory::CANCELLED_BY_CLIENT ? RequestState::CANCELLED
                    : RequestState::FAILED;
                record(state, call.sequence, &event.error);
                return Result<std::string>::error(std::move(event.error));
            }
            case StreamEvent::Kind::HEAD:
            case StreamEvent::Kind::PENDING:
                break;
        }
    }
}

Result<Completion> Dispatcher::complete(const ChatPayload& payload,
                                        Clock::time_point arrival,
                                        const RequestQueue::DisconnectProbe& probe) {
    auto started = start(payload, arrival, probe);
    if (started.is_error()) {
        return Result<Completion>::error(started.error_info());
    }

    StartedCall& call = started.value();
    auto body = read_body(call, probe);
    if (body.is_error()) {
        return Result<Completion>::error(body.error_info());
    }

    // COMPLETED: the slot goes back before the caller writes the response
    call.stream.reset();
    call.lease.release();
    utils::log::debug(std::format("Request #{} inference completed in {:.2f}s",
        call.sequence, seconds_between(call.call_start, Clock::now())));
    record(RequestState::COMPLETED, call.sequence, nullptr);

    Completion completion;
    completion.status = call.status;
    completion.content_type = call.content_type.empty()
        ? std::string("application/json") : std::move(call.content_type);
    completion.body = std::move(body.value());
    return Result<Completion>::ok(std::move(completion));
}

Result<std::unique_ptr<RelaySession>> Dispatcher::open_stream(
    const ChatPayload& payload,
    Clock::time_point arrival,
    const RequestQueue::DisconnectProbe& probe) {

    auto started = start(payload, arrival, probe);
    if (started.is_error()) {
        return Result<std::unique_ptr<RelaySession>>::error(started.error_info());
    }

    StartedCall& call = started.value();
    std::string content_type = call.content_type.empty()
        ? std::string("text/event-stream") : std::move(call.content_type);

    auto session = std::make_unique<RelaySession>(RelaySession::Key{},
        *this, std::move(call.lease), std::move(call.stream), call.sequence,
        call.status, std::move(content_type), call.deadline, call.call_start);
    return Result<std::unique_ptr<RelaySession>>::ok(std::move(session));
}

// ============================================================================
// Bookkeeping
// ============================================================================

void Dispatcher::record(RequestState state, uint64_t sequence, const Error* error) {
    switch (state) {
        case RequestState::COMPLETED:
            completed_.fetch_add(1, std::memory_order_relaxed);
            return;
        case RequestState::FAILED:
            failed_.fetch_add(1, std::memory_order_relaxed);
            break;
        case RequestState::TIMED_OUT:
            if (error && error->category == ErrorCategory::QUEUE_TIMEOUT) {
                timed_out_queued_.fetch_add(1, std::memory_order_relaxed);
            } else {
                timed_out_calling_.fetch_add(1, std::memory_order_relaxed);
            }
            break;
        case RequestState::CANCELLED:
            cancelled_.fetch_add(1, std::memory_order_relaxed);
            break;
        default:
            throw std::logic_error(std::format(
                "Dispatcher: request #{} recorded non-terminal state {}",
                sequence, request_state_to_string(state)));
    }

    const std::string_view reason = error ? std::string_view(error->message) : "";
    if (state == RequestState::CANCELLED) {
        utils::log::info(std::format("Request #{} cancelled: {}", sequence, reason));
    } else if (error && error->category != ErrorCategory::BACKEND_ERROR) {
        // BACKEND_ERROR was already logged with the backend's body
        utils::log::error(std::format("Request #{} {}: {}",
            sequence, request_state_to_string(state), reason));
    }
}

Dispatcher::Stats Dispatcher::get_stats() const {
    return {
        .completed = completed_.load(std::memory_order_relaxed),
        .failed = failed_.load(std::memory_order_relaxed),
        .rejected = rejected_.load(std::memory_order_relaxed),
        .timed_out_queued = timed_out_queued_.load(std::memory_order_relaxed),
        .timed_out_calling = timed_out_calling_.load(std::memory_order_relaxed),
        .cancelled = cancelled_.load(std::memory_order_relaxed),
    };
}

} // namespace lmgate
