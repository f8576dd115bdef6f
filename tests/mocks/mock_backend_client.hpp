#pragma once

#include "backend/ibackend_client.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lmgate::testing {

/**
 * @brief One scripted backend event, delivered `delay` after the previous one
 */
struct ScriptStep {
    std::chrono::milliseconds delay{0};
    StreamEvent event;
};

using Script = std::vector<ScriptStep>;

/**
 * @brief Live/abort counters shared between the mock client and its streams
 */
struct StreamCounters {
    std::atomic<int> live{0};
    std::atomic<int> max_live{0};
    std::atomic<int> aborted{0};

    void opened() {
        const int now = live.fetch_add(1) + 1;
        int prev = max_live.load();
        while (now > prev && !max_live.compare_exchange_weak(prev, now)) {}
    }
};

/**
 * @brief IChunkStream replaying a script in real time
 */
class ScriptedStream : public IChunkStream {
public:
    ScriptedStream(Script script, std::shared_ptr<StreamCounters> counters)
        : script_(std::move(script)), counters_(std::move(counters)),
          ready_at_(std::chrono::steady_clock::now() +
                    (script_.empty() ? std::chrono::milliseconds(0) : script_.front().delay)) {
        counters_->opened();
    }

    ~ScriptedStream() override { counters_->live.fetch_sub(1); }

    [[nodiscard]] StreamEvent next(std::chrono::steady_clock::time_point until) override {
        std::unique_lock lock(mutex_);
        if (index_ >= script_.size()) {
            StreamEvent end;
            end.kind = StreamEvent::Kind::END;
            return end;
        }
        cv_.wait_until(lock, std::min(until, ready_at_), [this] { return aborted_; });
        if (aborted_) {
            StreamEvent failed;
            failed.kind = StreamEvent::Kind::FAILED;
            failed.error = {ErrorCategory::CANCELLED_BY_CLIENT, "aborted", 0, "", ""};
            return failed;
        }
        if (std::chrono::steady_clock::now() < ready_at_) {
            return {};  // PENDING
        }
        StreamEvent event = script_[index_++];
        if (index_ < script_.size()) {
            ready_at_ = std::chrono::steady_clock::now() + script_[index_].delay;
        }
        return event;
    }

    void abort() override {
        std::lock_guard lock(mutex_);
        if (!aborted_) {
            aborted_ = true;
            counters_->aborted.fetch_add(1);
        }
        cv_.notify_all();
    }

private:
    Script script_;
    std::shared_ptr<StreamCounters> counters_;
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t index_ = 0;
    bool aborted_ = false;
    std::chrono::steady_clock::time_point ready_at_;
};

// ============================================================================
// Script builders
// ============================================================================

inline StreamEvent head_event(int status, std::string content_type = "application/json") {
    StreamEvent e;
    e.kind = StreamEvent::Kind::HEAD;
    e.status = status;
    e.content_type = std::move(content_type);
    return e;
}

inline StreamEvent chunk_event(std::string data) {
    StreamEvent e;
    e.kind = StreamEvent::Kind::CHUNK;
    e.data = std::move(data);
    return e;
}

inline StreamEvent end_event() {
    StreamEvent e;
    e.kind = StreamEvent::Kind::END;
    return e;
}

inline StreamEvent failed_event(ErrorCategory category, std::string message) {
    StreamEvent e;
    e.kind = StreamEvent::Kind::FAILED;
    e.error = {category, std::move(message), 0, "", ""};
    return e;
}

/// Whole response after `latency`
inline Script reply(int status, std::string body,
                    std::chrono::milliseconds latency = std::chrono::milliseconds(0)) {
    return {
        {latency, head_event(status)},
        {std::chrono::milliseconds(0), chunk_event(std::move(body))},
        {std::chrono::milliseconds(0), end_event()},
    };
}

/// SSE response: one chunk every `gap`
inline Script sse_reply(const std::vector<std::string>& chunks,
                        std::chrono::milliseconds gap = std::chrono::milliseconds(0)) {
    Script script{{std::chrono::milliseconds(0), head_event(200, "text/event-stream")}};
    for (const auto& c : chunks) {
        script.push_back({gap, chunk_event(c)});
    }
    script.push_back({std::chrono::milliseconds(0), end_event()});
    return script;
}

/// Backend that never answers
inline Script hang() {
    return {{std::chrono::hours(1), head_event(200)}};
}

inline Script transport_failure(ErrorCategory category = ErrorCategory::BACKEND_UNAVAILABLE,
                                std::chrono::milliseconds latency = std::chrono::milliseconds(0)) {
    return {{latency, failed_event(category, "connection refused")}};
}

// ============================================================================
// MockBackendClient
// ============================================================================

/**
 * @brief Scripted backend. Each call() consumes the next queued script,
 * falling back to the default one.
 */
class MockBackendClient : public IBackendClient {
public:
    MockBackendClient() : counters_(std::make_shared<StreamCounters>()) {}

    [[nodiscard]] std::unique_ptr<IChunkStream> call(const UpstreamCall& call) override {
        Script script;
        {
            std::lock_guard lock(mutex_);
            calls_.push_back(call);
            if (!scripts_.empty()) {
                script = std::move(scripts_.front());
                scripts_.pop_front();
            } else {
                script = default_script_;
            }
        }
        return std::make_unique<ScriptedStream>(std::move(script), counters_);
    }

    [[nodiscard]] Result<BackendReply> forward(const ForwardRequest& request) override {
        std::lock_guard lock(mutex_);
        forwards_.push_back(request);
        return forward_result_;
    }

    [[nodiscard]] Result<BackendReply> fetch(const std::string& path,
                                             std::chrono::milliseconds /*timeout*/) override {
        std::lock_guard lock(mutex_);
        const auto it = fetch_results_.find(path);
        if (it != fetch_results_.end()) {
            return it->second;
        }
        return Result<BackendReply>::error(ErrorCategory::BACKEND_UNAVAILABLE, "connection refused");
    }

    [[nodiscard]] const std::string& base_url() const override { return base_url_; }

    // ── Scripting ───────────────────────────────────────────────────────
    void push_script(Script script) {
        std::lock_guard lock(mutex_);
        scripts_.push_back(std::move(script));
    }
    void set_default_script(Script script) {
        std::lock_guard lock(mutex_);
        default_script_ = std::move(script);
    }
    void set_forward_result(Result<BackendReply> result) {
        std::lock_guard lock(mutex_);
        forward_result_ = std::move(result);
    }
    void set_fetch_result(const std::string& path, Result<BackendReply> result) {
        std::lock_guard lock(mutex_);
        fetch_results_.insert_or_assign(path, std::move(result));
    }

    // ── Inspection ──────────────────────────────────────────────────────
    [[nodiscard]] std::vector<UpstreamCall> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }
    [[nodiscard]] std::vector<ForwardRequest> forwards() const {
        std::lock_guard lock(mutex_);
        return forwards_;
    }
    [[nodiscard]] size_t call_count() const {
        std::lock_guard lock(mutex_);
        return calls_.size();
    }
    [[nodiscard]] int live_streams() const { return counters_->live.load(); }
    [[nodiscard]] int max_live_streams() const { return counters_->max_live.load(); }
    [[nodiscard]] int aborted_streams() const { return counters_->aborted.load(); }

private:
    std::shared_ptr<StreamCounters> counters_;
    mutable std::mutex mutex_;
    std::deque<Script> scripts_;
    Script default_script_ = reply(200, R"({"choices":[]})");
    std::vector<UpstreamCall> calls_;
    std::vector<ForwardRequest> forwards_;
    Result<BackendReply> forward_result_ =
        Result<BackendReply>::ok(BackendReply{200, "{}", "application/json"});
    std::map<std::string, Result<BackendReply>> fetch_results_;
    const std::string base_url_ = "http://mock-backend:8080";
};

} // namespace lmgate::testing
