#pragma once

#include <atomic>
#include <cstdint>

namespace lmgate {

/**
 * @brief Counting concurrency limiter in front of the backend
 *
 * Bounds how many requests may be in flight to the backend at once.
 * Invariant: 0 <= active <= capacity. Capacity is fixed at construction.
 *
 * Thread-safe via atomic operations. Admission order is not decided here:
 * RequestQueue serializes waiters and is the only caller in the gateway.
 */
class AdmissionGate {
public:
    explicit AdmissionGate(uint32_t capacity);

    /**
     * @brief Take a slot if one is free. Never blocks.
     *
     * If it returns true, the caller MUST call release() exactly once.
     */
    [[nodiscard]] bool try_acquire();

    /**
     * @brief Return a slot taken by try_acquire()
     *
     * @throws std::logic_error if no slot is held (unmatched release)
     */
    void release();

    [[nodiscard]] uint32_t capacity() const { return capacity_; }
    [[nodiscard]] uint32_t active() const { return active_.load(std::memory_order_acquire); }

    struct Stats {
        uint64_t acquired;
        uint64_t released;
        uint32_t active;
        uint32_t capacity;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    const uint32_t capacity_;
    std::atomic<uint32_t> active_{0};
    std::atomic<uint64_t> acquired_{0};
    std::atomic<uint64_t> released_{0};
};

} // namespace lmgate
