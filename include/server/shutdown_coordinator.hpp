#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace lmgate {

class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Stop admitting new requests. Idempotent.
    void initiate_shutdown();

    /// Called at start of each request. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();

    /// Called when request completes (streams: when the relay ends).
    void leave_request();

    /// Blocks until all in-flight requests complete or timeout.
    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_relaxed);
    }

    /**
     * @brief RAII in-flight registration. Move-only; leaves on destruction.
     */
    class RequestGuard {
    public:
        RequestGuard() = default;
        explicit RequestGuard(ShutdownCoordinator* owner) : owner_(owner) {}
        ~RequestGuard() { if (owner_) owner_->leave_request(); }

        RequestGuard(RequestGuard&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        RequestGuard& operator=(RequestGuard&& other) noexcept {
            if (this != &other) {
                if (owner_) owner_->leave_request();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }

        RequestGuard(const RequestGuard&) = delete;
        RequestGuard& operator=(const RequestGuard&) = delete;

        [[nodiscard]] bool entered() const { return owner_ != nullptr; }

    private:
        ShutdownCoordinator* owner_ = nullptr;
    };

    /// try_enter_request() wrapped in a guard; entered() is false when refused
    [[nodiscard]] RequestGuard enter();

private:
    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

} // namespace lmgate
