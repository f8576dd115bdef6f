#pragma once

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace lmgate {

/**
 * @brief httplib task queue that never parks a connection behind busy threads
 *
 * Keeps `core_threads` workers warm and starts another worker whenever a
 * connection arrives with no idle worker to take it. Extra workers retire
 * after `idle_timeout` without work. Queued chat callers hold their
 * worker inside RequestQueue; /health and /v1/queue/status still get one.
 */
class HandlerPool final : public httplib::TaskQueue {
public:
    HandlerPool(size_t core_threads, std::chrono::milliseconds idle_timeout);
    ~HandlerPool() override;

    HandlerPool(const HandlerPool&) = delete;
    HandlerPool& operator=(const HandlerPool&) = delete;

    /// Run fn on an idle worker, or on a new one. False after shutdown().
    bool enqueue(std::function<void()> fn) override;

    /// Finish queued work, then join every worker. Idempotent.
    void shutdown() override;

    struct Stats {
        size_t threads;      // workers alive now
        size_t idle;         // of which waiting for work
        size_t peak_threads;
        uint64_t spawned;
        uint64_t retired;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    void worker_loop();
    void spawn_locked();

    const size_t core_threads_;
    const std::chrono::milliseconds idle_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    std::unordered_map<std::thread::id, std::thread> workers_;
    std::vector<std::thread> retired_;   // exited, not yet joined
    size_t idle_ = 0;
    size_t peak_threads_ = 0;
    uint64_t spawned_ = 0;
    uint64_t retired_total_ = 0;
    bool shutdown_ = false;
};

} // namespace lmgate
