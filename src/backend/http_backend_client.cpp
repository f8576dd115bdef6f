#include "backend/http_backend_client.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <algorithm>
#include <format>
#include <stdexcept>

namespace lmgate {

namespace {

constexpr std::chrono::milliseconds kMinTimeout{1};
// A transport error this close to the deadline is the deadline's doing
constexpr std::chrono::milliseconds kDeadlineSlack{10};

Error classify_transport_failure(httplib::Error err,
                                 std::chrono::steady_clock::time_point deadline) {
    Error e;
    if (std::chrono::steady_clock::now() + kDeadlineSlack >= deadline) {
        e.category = ErrorCategory::BACKEND_TIMEOUT;
        e.message = std::format("backend did not answer in time ({})", httplib::to_string(err));
    } else {
        e.category = ErrorCategory::BACKEND_UNAVAILABLE;
        e.message = std::format("backend unreachable: {}", httplib::to_string(err));
    }
    return e;
}

void apply_timeouts(httplib::Client& cli, std::chrono::milliseconds timeout) {
    const auto t = std::max(timeout, kMinTimeout);
    cli.set_connection_timeout(t);
    cli.set_read_timeout(t);
    cli.set_write_timeout(t);
}

} // anonymous namespace

// ============================================================================
// HttpChunkStream
// ============================================================================

HttpChunkStream::HttpChunkStream(const BaseUrl& base, UpstreamCall call, const Limits& limits)
    : call_(std::move(call)),
      limits_(limits),
      request_path_(base.join(call_.path)),
      client_(std::make_unique<httplib::Client>(base.origin())) {
    apply_timeouts(*client_, call_.timeout);
    worker_ = std::thread(&HttpChunkStream::run, this);
}

HttpChunkStream::~HttpChunkStream() {
    abort();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void HttpChunkStream::run() {
    httplib::Request req;
    req.method = "POST";
    req.path = request_path_;
    req.body = call_.payload;
    req.set_header("Content-Type", "application/json");
    if (call_.streaming) {
        req.set_header("Accept", "text/event-stream");
    }

    req.response_handler = [this](const httplib::Response& response) {
        StreamEvent head;
        head.kind = StreamEvent::Kind::HEAD;
        head.status = response.status;
        head.content_type = response.get_header_value("Content-Type");
        return push(std::move(head));
    };
    req.content_receiver = [this](const char* data, size_t length,
                                  uint64_t /*offset*/, uint64_t /*total*/) {
        StreamEvent chunk;
        chunk.kind = StreamEvent::Kind::CHUNK;
        chunk.data.assign(data, length);
        return push(std::move(chunk));
    };

    httplib::Response res;
    auto err = httplib::Error::Success;
    const bool ok = client_->send(req, res, err);

    if (aborted_.load(std::memory_order_acquire)) {
        return;
    }

    StreamEvent last;
    if (ok) {
        last.kind = StreamEvent::Kind::END;
    } else {
        last.kind = StreamEvent::Kind::FAILED;
        last.error = classify_transport_failure(err, call_.deadline);
    }
    (void)push(std::move(last));
}

bool HttpChunkStream::push(StreamEvent event) {
    std::unique_lock lock(mutex_);
    const size_t bytes = event.data.size();
    writable_cv_.wait(lock, [&] {
        return aborted_.load(std::memory_order_relaxed) ||
               buffered_bytes_ == 0 ||
               buffered_bytes_ + bytes <= limits_.max_buffered_bytes;
    });
    if (aborted_.load(std::memory_order_relaxed)) {
        return false;
    }
    buffered_bytes_ += bytes;
    events_.push_back(std::move(event));
    readable_cv_.notify_one();
    return true;
}

StreamEvent HttpChunkStream::next(std::chrono::steady_clock::time_point until) {
    std::unique_lock lock(mutex_);

    if (terminal_delivered_) {
        StreamEvent done;
        done.kind = StreamEvent::Kind::FAILED;
        done.error = {ErrorCategory::INTERNAL_ERROR, "backend stream already consumed", 0, "", ""};
        return done;
    }

    const bool ready = readable_cv_.wait_until(lock, until, [this] {
        return !events_.empty() || aborted_.load(std::memory_order_relaxed);
    });
    if (!ready) {
        return {};  // PENDING
    }

    if (events_.empty()) {
        terminal_delivered_ = true;
        StreamEvent aborted;
        aborted.kind = StreamEvent::Kind::FAILED;
        aborted.error = {ErrorCategory::CANCELLED_BY_CLIENT, "backend stream aborted", 0, "", ""};
        return aborted;
    }

    StreamEvent event = std::move(events_.front());
    events_.pop_front();
    buffered_bytes_ -= event.data.size();
    if (event.kind == StreamEvent::Kind::END || event.kind == StreamEvent::Kind::FAILED) {
        terminal_delivered_ = true;
    }
    writable_cv_.notify_one();
    return event;
}

void HttpChunkStream::abort() {
    {
        std::lock_guard lock(mutex_);
        if (aborted_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        // Nothing read after an abort is delivered
        events_.clear();
        buffered_bytes_ = 0;
    }
    writable_cv_.notify_all();
    readable_cv_.notify_all();
    // Shuts the socket down under httplib's own lock; unblocks a pending recv
    client_->stop();
}

// ============================================================================
// HttpBackendClient
// ============================================================================

HttpBackendClient::HttpBackendClient(Config config)
    : config_(std::move(config)) {
    auto parsed = parse_base_url(config_.base_url);
    if (!parsed) {
        throw std::invalid_argument(std::format("Invalid backend URL: '{}'", config_.base_url));
    }
    base_ = std::move(*parsed);
}

std::unique_ptr<IChunkStream> HttpBackendClient::call(const UpstreamCall& call) {
    calls_.fetch_add(1, std::memory_order_relaxed);
    return std::make_unique<HttpChunkStream>(
        base_, call, HttpChunkStream::Limits{config_.max_buffered_bytes});
}

Result<BackendReply> HttpBackendClient::forward(const ForwardRequest& request) {
    forwards_.fetch_add(1, std::memory_order_relaxed);
    const std::string content_type = request.content_type.empty()
        ? std::string("application/json") : request.content_type;
    return send_buffered(request.method, request.target, request.body, content_type, request.timeout);
}

Result<BackendReply> HttpBackendClient::fetch(const std::string& path,
                                              std::chrono::milliseconds timeout) {
    fetches_.fetch_add(1, std::memory_order_relaxed);
    return send_buffered("GET", path, "", "", timeout);
}

Result<BackendReply> HttpBackendClient::send_buffered(const std::string& method,
                                                      const std::string& target,
                                                      const std::string& body,
                                                      const std::string& content_type,
                                                      std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    httplib::Client cli(base_.origin());
    apply_timeouts(cli, timeout);

    httplib::Request req;
    req.method = method;
    req.path = base_.join(target);
    req.body = body;
    if (!content_type.empty()) {
        req.set_header("Content-Type", content_type);
    }

    httplib::Response res;
    auto err = httplib::Error::Success;
    if (!cli.send(req, res, err)) {
        transport_errors_.fetch_add(1, std::memory_order_relaxed);
        auto error = classify_transport_failure(err, deadline);
        utils::log::error(std::format("Backend {} {} failed: {}", method, req.path, error.message));
        return Result<BackendReply>::error(std::move(error));
    }

    BackendReply reply;
    reply.status = res.status;
    reply.content_type = res.get_header_value("Content-Type");
    reply.body = std::move(res.body);
    return Result<BackendReply>::ok(std::move(reply));
}

HttpBackendClient::Stats HttpBackendClient::get_stats() const {
    return {
        calls_.load(std::memory_order_relaxed),
        forwards_.load(std::memory_order_relaxed),
        fetches_.load(std::memory_order_relaxed),
        transport_errors_.load(std::memory_order_relaxed)
    };
}

} // namespace lmgate
