#include "admission/request_queue.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace lmgate {

RequestQueue::RequestQueue(std::shared_ptr<AdmissionGate> gate)
    : RequestQueue(std::move(gate), Config{}) {}

RequestQueue::RequestQueue(std::shared_ptr<AdmissionGate> gate, const Config& config)
    : gate_(std::move(gate)), config_(config) {
    if (!gate_) {
        throw std::invalid_argument("RequestQueue requires an AdmissionGate");
    }
}

// ============================================================================
// Enqueue / Wait
// ============================================================================

PendingHandle RequestQueue::enqueue(std::chrono::steady_clock::time_point deadline) {
    std::lock_guard lock(mutex_);
    auto entry = std::make_shared<PendingRequest>(
        next_sequence_++, std::chrono::steady_clock::now(), deadline);
    enqueued_.fetch_add(1, std::memory_order_relaxed);

    if (closed_) {
        entry->cancel_requested_.store(true, std::memory_order_release);
        resolve_locked(*entry, PendingRequest::State::CANCELLED);
        return entry;
    }

    waiting_.emplace(entry->sequence(), entry);
    grant_waiting_locked();
    return entry;
}

WaitOutcome RequestQueue::wait(const PendingHandle& entry,
                               std::chrono::steady_clock::time_point deadline,
                               const DisconnectProbe& probe) {
    deadline = std::min(deadline, entry->deadline());
    std::unique_lock lock(mutex_);

    while (entry->state_ == PendingRequest::State::WAITING) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            waiting_.erase(entry->sequence());
            resolve_locked(*entry, PendingRequest::State::TIMED_OUT);
            break;
        }

        const auto wake_at = probe ? std::min(deadline, now + config_.poll_interval) : deadline;
        entry->cv_.wait_until(lock, wake_at);
        if (entry->state_ != PendingRequest::State::WAITING) break;

        if (probe) {
            // Probe touches the client socket; never hold the queue lock across it
            lock.unlock();
            const bool gone = probe();
            lock.lock();
            if (gone && entry->state_ == PendingRequest::State::WAITING) {
                entry->cancel_requested_.store(true, std::memory_order_release);
                waiting_.erase(entry->sequence());
                resolve_locked(*entry, PendingRequest::State::CANCELLED);
            }
        }
    }

    switch (entry->state_) {
        case PendingRequest::State::ADMITTED:  return WaitOutcome::ADMITTED;
        case PendingRequest::State::TIMED_OUT: return WaitOutcome::TIMED_OUT;
        case PendingRequest::State::CANCELLED: return WaitOutcome::CANCELLED;
        case PendingRequest::State::WAITING:   break;
    }
    throw std::logic_error(std::format(
        "RequestQueue: entry #{} left wait() unresolved", entry->sequence()));
}

void RequestQueue::cancel(const PendingHandle& entry) {
    entry->cancel_requested_.store(true, std::memory_order_release);

    std::lock_guard lock(mutex_);
    if (entry->state_ != PendingRequest::State::WAITING) {
        return;  // already resolved; the outcome stands
    }
    waiting_.erase(entry->sequence());
    resolve_locked(*entry, PendingRequest::State::CANCELLED);
}

// ============================================================================
// Release / Grant
// ============================================================================

void RequestQueue::release() {
    std::lock_guard lock(mutex_);
    gate_->release();
    grant_waiting_locked();
}

void RequestQueue::grant_waiting_locked() {
    const auto now = std::chrono::steady_clock::now();
    while (!waiting_.empty()) {
        auto it = waiting_.begin();
        if (it->second->deadline() <= now) {
            // Expired but not yet awake: it must not take a slot from a live waiter
            auto expired = std::move(it->second);
            waiting_.erase(it);
            resolve_locked(*expired, PendingRequest::State::TIMED_OUT);
            continue;
        }
        if (!gate_->try_acquire()) {
            break;
        }
        auto entry = std::move(it->second);
        waiting_.erase(it);
        if (entry->state_ != PendingRequest::State::WAITING) {
            const auto msg = std::format(
                "RequestQueue invariant violated: entry #{} granted twice", entry->sequence());
            utils::log::error(msg);
            throw std::logic_error(msg);
        }
        resolve_locked(*entry, PendingRequest::State::ADMITTED);
    }
}

void RequestQueue::resolve_locked(PendingRequest& entry, PendingRequest::State state) {
    entry.state_ = state;
    switch (state) {
        case PendingRequest::State::ADMITTED:
            admitted_.fetch_add(1, std::memory_order_relaxed);
            break;
        case PendingRequest::State::TIMED_OUT:
            timed_out_.fetch_add(1, std::memory_order_relaxed);
            break;
        case PendingRequest::State::CANCELLED:
            cancelled_.fetch_add(1, std::memory_order_relaxed);
            break;
        case PendingRequest::State::WAITING:
            break;
    }
    entry.cv_.notify_all();
}

// ============================================================================
// acquire_blocking: enqueue + wait + lease
// ============================================================================

RequestQueue::Acquisition RequestQueue::acquire_blocking(
    std::chrono::steady_clock::time_point deadline,
    const DisconnectProbe& probe) {

    Acquisition result;
    const auto entry = enqueue(deadline);
    result.sequence = entry->sequence();
    result.outcome = wait(entry, deadline, probe);
    result.waited = std::chrono::steady_clock::now() - entry->arrival();
    if (result.outcome == WaitOutcome::ADMITTED) {
        result.lease = SlotLease([this] { release(); });
    }
    return result;
}

// ============================================================================
// Shutdown
// ============================================================================

void RequestQueue::close() {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    closed_ = true;

    const size_t dropped = waiting_.size();
    for (auto& [seq, entry] : waiting_) {
        entry->cancel_requested_.store(true, std::memory_order_release);
        resolve_locked(*entry, PendingRequest::State::CANCELLED);
    }
    waiting_.clear();

    utils::log::info(std::format("Request queue closed ({} waiters cancelled)", dropped));
}

bool RequestQueue::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

// ============================================================================
// Introspection
// ============================================================================

RequestQueue::Snapshot RequestQueue::snapshot() const {
    std::lock_guard lock(mutex_);
    Snapshot snap;
    snap.capacity = gate_->capacity();
    snap.active = gate_->active();
    snap.queued = waiting_.size();
    if (!waiting_.empty()) {
        snap.oldest_arrival = waiting_.begin()->second->arrival();
    }
    return snap;
}

size_t RequestQueue::length() const {
    std::lock_guard lock(mutex_);
    return waiting_.size();
}

RequestQueue::Stats RequestQueue::get_stats() const {
    return {
        .enqueued = enqueued_.load(std::memory_order_relaxed),
        .admitted = admitted_.load(std::memory_order_relaxed),
        .timed_out = timed_out_.load(std::memory_order_relaxed),
        .cancelled = cancelled_.load(std::memory_order_relaxed),
    };
}

} // namespace lmgate
