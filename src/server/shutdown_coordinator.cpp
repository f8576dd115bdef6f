#include "server/shutdown_coordinator.hpp"
#include "core/utils.hpp"

#include <format>

namespace lmgate {

ShutdownCoordinator::ShutdownCoordinator() = default;

ShutdownCoordinator::ShutdownCoordinator(const Config& config)
    : config_(config) {}

void ShutdownCoordinator::initiate_shutdown() {
    if (shutting_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    utils::log::info(std::format("Shutdown initiated, {} request(s) in flight",
        in_flight_.load(std::memory_order_relaxed)));
    std::lock_guard lock(drain_mutex_);
    drain_cv_.notify_all();
}

bool ShutdownCoordinator::try_enter_request() {
    if (shutting_down_.load(std::memory_order_acquire)) {
        return false;
    }
    in_flight_.fetch_add(1, std::memory_order_acq_rel);
    // Double-check after increment (avoid race with initiate_shutdown)
    if (shutting_down_.load(std::memory_order_acquire)) {
        leave_request();
        return false;
    }
    return true;
}

void ShutdownCoordinator::leave_request() {
    const uint32_t prev = in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    if (prev == 1 && shutting_down_.load(std::memory_order_acquire)) {
        std::lock_guard lock(drain_mutex_);
        drain_cv_.notify_all();
    }
}

ShutdownCoordinator::RequestGuard ShutdownCoordinator::enter() {
    return try_enter_request() ? RequestGuard(this) : RequestGuard();
}

bool ShutdownCoordinator::wait_for_drain() {
    std::unique_lock lock(drain_mutex_);
    return drain_cv_.wait_for(lock, config_.shutdown_timeout, [this] {
        return in_flight_.load(std::memory_order_acquire) == 0;
    });
}

} // namespace lmgate
