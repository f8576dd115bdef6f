#pragma once

#include "admission/admission_gate.hpp"
#include "admission/slot_lease.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace lmgate {

enum class WaitOutcome : uint8_t {
    ADMITTED,
    TIMED_OUT,
    CANCELLED
};

[[nodiscard]] inline const char* wait_outcome_to_string(WaitOutcome outcome) {
    switch (outcome) {
        case WaitOutcome::ADMITTED:  return "admitted";
        case WaitOutcome::TIMED_OUT: return "timed_out";
        case WaitOutcome::CANCELLED: return "cancelled";
        default:                     return "unknown";
    }
}

/**
 * @brief One caller waiting for admission
 *
 * The resolution state and condition variable are guarded by the owning
 * RequestQueue's mutex; the entry resolves exactly once.
 */
class PendingRequest {
public:
    PendingRequest(uint64_t sequence,
                   std::chrono::steady_clock::time_point arrival,
                   std::chrono::steady_clock::time_point deadline)
        : sequence_(sequence), arrival_(arrival), deadline_(deadline) {}

    [[nodiscard]] uint64_t sequence() const { return sequence_; }
    [[nodiscard]] std::chrono::steady_clock::time_point arrival() const { return arrival_; }
    [[nodiscard]] std::chrono::steady_clock::time_point deadline() const { return deadline_; }
    [[nodiscard]] bool cancel_requested() const {
        return cancel_requested_.load(std::memory_order_acquire);
    }

private:
    friend class RequestQueue;

    enum class State : uint8_t { WAITING, ADMITTED, TIMED_OUT, CANCELLED };

    const uint64_t sequence_;
    const std::chrono::steady_clock::time_point arrival_;
    const std::chrono::steady_clock::time_point deadline_;
    State state_ = State::WAITING;
    std::condition_variable cv_;
    std::atomic<bool> cancel_requested_{false};
};

using PendingHandle = std::shared_ptr<PendingRequest>;

/**
 * @brief FIFO waiting list in front of the AdmissionGate
 *
 * The gate's active count and the ordered waiting list share one mutex:
 * "check capacity, grant slot, remove from queue" is a single critical
 * section, so a freed slot goes to exactly one waiter and always to the
 * one with the smallest sequence number.
 *
 * Leases handed out by acquire_blocking() call back into this queue; the
 * queue must outlive them.
 */
class RequestQueue {
public:
    // Returns true once the caller is known to be gone
    using DisconnectProbe = std::function<bool()>;

    struct Config {
        std::chrono::milliseconds poll_interval{100};   // disconnect probe cadence
    };

    explicit RequestQueue(std::shared_ptr<AdmissionGate> gate);
    RequestQueue(std::shared_ptr<AdmissionGate> gate, const Config& config);

    /**
     * @brief Append a new waiter and admit as many waiters as capacity allows.
     *
     * The returned entry may already be admitted when the gate had room.
     * After close() the entry comes back already cancelled. An entry past
     * its deadline is resolved TIMED_OUT instead of being granted a slot.
     */
    [[nodiscard]] PendingHandle enqueue(
        std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max());

    /**
     * @brief Block until the entry is admitted, the deadline passes, or the
     * caller is cancelled, whichever is decided first under the queue lock.
     *
     * ADMITTED means the gate already counts the slot; the caller owns it
     * and must return it through release(). The earlier of `deadline` and
     * the one given to enqueue() applies.
     */
    [[nodiscard]] WaitOutcome wait(const PendingHandle& entry,
                                   std::chrono::steady_clock::time_point deadline,
                                   const DisconnectProbe& probe = {});

    /**
     * @brief Fire the entry's cancellation signal.
     *
     * Removes it from the queue if it is still waiting. Does nothing to an
     * entry already admitted: its slot stays owned by the caller.
     */
    void cancel(const PendingHandle& entry);

    /**
     * @brief Return one slot to the gate and hand it to the oldest waiter
     * whose deadline has not passed.
     * @throws std::logic_error on an unmatched release
     */
    void release();

    struct Acquisition {
        WaitOutcome outcome = WaitOutcome::CANCELLED;
        uint64_t sequence = 0;
        std::chrono::steady_clock::duration waited{};
        SlotLease lease;    // held only when outcome == ADMITTED
    };

    /**
     * @brief enqueue() + wait(), wrapping an admitted slot in a SlotLease
     */
    [[nodiscard]] Acquisition acquire_blocking(std::chrono::steady_clock::time_point deadline,
                                               const DisconnectProbe& probe = {});

    /**
     * @brief Cancel every waiter and refuse new ones (shutdown).
     */
    void close();
    [[nodiscard]] bool is_closed() const;

    struct Snapshot {
        uint32_t capacity = 0;
        uint32_t active = 0;
        size_t queued = 0;
        std::optional<std::chrono::steady_clock::time_point> oldest_arrival;
    };

    /**
     * @brief Consistent view of gate + queue, taken under the queue lock
     */
    [[nodiscard]] Snapshot snapshot() const;

    [[nodiscard]] size_t length() const;
    [[nodiscard]] const AdmissionGate& gate() const { return *gate_; }

    struct Stats {
        uint64_t enqueued;
        uint64_t admitted;
        uint64_t timed_out;
        uint64_t cancelled;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    // Caller holds mutex_
    void grant_waiting_locked();
    void resolve_locked(PendingRequest& entry, PendingRequest::State state);

    std::shared_ptr<AdmissionGate> gate_;
    const Config config_;

    mutable std::mutex mutex_;
    std::map<uint64_t, PendingHandle> waiting_;     // sequence → entry, oldest first
    uint64_t next_sequence_ = 1;
    bool closed_ = false;

    std::atomic<uint64_t> enqueued_{0};
    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> cancelled_{0};
};

} // namespace lmgate
