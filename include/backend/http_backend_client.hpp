#pragma once

#include "backend/ibackend_client.hpp"
#include "core/url.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
class Client;
}

namespace lmgate {

/**
 * @brief Backend response read by a producer thread
 *
 * The worker runs the blocking httplib request and hands events to the
 * consumer through a bounded buffer; a full buffer blocks the worker, so
 * a slow caller slows the backend read instead of growing memory.
 * abort() stops the socket from the consumer side.
 */
class HttpChunkStream : public IChunkStream {
public:
    struct Limits {
        size_t max_buffered_bytes = 1024 * 1024;
    };

    HttpChunkStream(const BaseUrl& base, UpstreamCall call, const Limits& limits);
    ~HttpChunkStream() override;

    HttpChunkStream(const HttpChunkStream&) = delete;
    HttpChunkStream& operator=(const HttpChunkStream&) = delete;

    [[nodiscard]] StreamEvent next(std::chrono::steady_clock::time_point until) override;
    void abort() override;

private:
    void run();
    bool push(StreamEvent event);   // false once aborted

    const UpstreamCall call_;
    const Limits limits_;
    const std::string request_path_;
    std::unique_ptr<httplib::Client> client_;

    std::mutex mutex_;
    std::condition_variable readable_cv_;
    std::condition_variable writable_cv_;
    std::deque<StreamEvent> events_;
    size_t buffered_bytes_ = 0;
    bool terminal_delivered_ = false;
    std::atomic<bool> aborted_{false};

    std::thread worker_;
};

/**
 * @brief IBackendClient over cpp-httplib
 */
class HttpBackendClient : public IBackendClient {
public:
    struct Config {
        std::string base_url = "http://127.0.0.1:8080";
        size_t max_buffered_bytes = 1024 * 1024;
    };

    /**
     * @throws std::invalid_argument if base_url is not http(s)://host[:port][/prefix]
     */
    explicit HttpBackendClient(Config config);

    [[nodiscard]] std::unique_ptr<IChunkStream> call(const UpstreamCall& call) override;
    [[nodiscard]] Result<BackendReply> forward(const ForwardRequest& request) override;
    [[nodiscard]] Result<BackendReply> fetch(const std::string& path,
                                             std::chrono::milliseconds timeout) override;

    [[nodiscard]] const std::string& base_url() const override { return config_.base_url; }

    struct Stats {
        uint64_t calls;
        uint64_t forwards;
        uint64_t fetches;
        uint64_t transport_errors;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] Result<BackendReply> send_buffered(const std::string& method,
                                                     const std::string& target,
                                                     const std::string& body,
                                                     const std::string& content_type,
                                                     std::chrono::milliseconds timeout);

    Config config_;
    BaseUrl base_;

    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> forwards_{0};
    std::atomic<uint64_t> fetches_{0};
    std::atomic<uint64_t> transport_errors_{0};
};

} // namespace lmgate
