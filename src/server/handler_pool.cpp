#include "server/handler_pool.hpp"

#include <algorithm>

namespace lmgate {

HandlerPool::HandlerPool(size_t core_threads, std::chrono::milliseconds idle_timeout)
    : core_threads_(std::max<size_t>(1, core_threads)),
      idle_timeout_(idle_timeout) {
    std::lock_guard lock(mutex_);
    for (size_t i = 0; i < core_threads_; ++i) {
        spawn_locked();
    }
}

HandlerPool::~HandlerPool() {
    shutdown();
}

bool HandlerPool::enqueue(std::function<void()> fn) {
    std::vector<std::thread> finished;
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return false;
        }
        jobs_.push_back(std::move(fn));
        if (idle_ < jobs_.size()) {
            spawn_locked();
        }
        finished.swap(retired_);
    }
    cv_.notify_one();

    for (auto& t : finished) {
        t.join();
    }
    return true;
}

void HandlerPool::shutdown() {
    std::unordered_map<std::thread::id, std::thread> workers;
    std::vector<std::thread> finished;
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        // No worker retires once shutdown_ is set, so the map is final
        workers.swap(workers_);
        finished.swap(retired_);
    }
    cv_.notify_all();

    for (auto& [id, t] : workers) {
        t.join();
    }
    for (auto& t : finished) {
        t.join();
    }
}

HandlerPool::Stats HandlerPool::get_stats() const {
    std::lock_guard lock(mutex_);
    return {
        .threads = workers_.size(),
        .idle = idle_,
        .peak_threads = peak_threads_,
        .spawned = spawned_,
        .retired = retired_total_,
    };
}

void HandlerPool::spawn_locked() {
    // The worker locks mutex_ first, so it finds itself in workers_
    std::thread t([this] { worker_loop(); });
    const auto id = t.get_id();
    workers_.emplace(id, std::move(t));
    ++spawned_;
    peak_threads_ = std::max(peak_threads_, workers_.size());
}

void HandlerPool::worker_loop() {
    std::unique_lock lock(mutex_);
    for (;;) {
        if (jobs_.empty()) {
            if (shutdown_) {
                return;
            }
            ++idle_;
            const bool woke = cv_.wait_for(lock, idle_timeout_,
                [this] { return shutdown_ || !jobs_.empty(); });
            --idle_;
            if (!woke && workers_.size() > core_threads_) {
                auto self = workers_.find(std::this_thread::get_id());
                retired_.push_back(std::move(self->second));
                workers_.erase(self);
                ++retired_total_;
                return;
            }
            continue;
        }

        auto job = std::move(jobs_.front());
        jobs_.pop_front();
        lock.unlock();
        job();
        lock.lock();
    }
}

} // namespace lmgate
