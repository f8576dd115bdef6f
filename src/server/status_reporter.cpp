#include "server/status_reporter.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace lmgate {

StatusReporter::StatusReporter(std::shared_ptr<const RequestQueue> queue, std::string backend_url)
    : queue_(std::move(queue)), backend_url_(std::move(backend_url)) {
    if (!queue_) {
        throw std::invalid_argument("StatusReporter requires a RequestQueue");
    }
}

StatusSnapshot StatusReporter::snapshot(std::chrono::steady_clock::time_point now) const {
    const auto raw = queue_->snapshot();

    StatusSnapshot snap;
    snap.capacity = raw.capacity;
    snap.active = raw.active;
    snap.queued = raw.queued;
    if (raw.oldest_arrival) {
        // Clamp: `now` may be older than an arrival recorded after it was taken
        const auto waited = std::max(now - *raw.oldest_arrival,
                                     std::chrono::steady_clock::duration::zero());
        snap.oldest_wait_seconds = std::chrono::duration<double>(waited).count();
    }
    return snap;
}

std::string StatusReporter::core_fields_json(const StatusSnapshot& snap) {
    return std::format(
        R"({{"capacity":{},"active":{},"queued":{},"oldest_wait_seconds":{:.3f}}})",
        snap.capacity, snap.active, snap.queued, snap.oldest_wait_seconds);
}

std::string StatusReporter::to_json(const StatusSnapshot& snap) const {
    const uint32_t available = snap.capacity > snap.active ? snap.capacity - snap.active : 0;
    return std::format(
        R"({{"capacity":{},"active":{},"queued":{},"oldest_wait_seconds":{:.3f},)"
        R"("max_concurrent":{},"available_slots":{},"backend_url":"{}"}})",
        snap.capacity, snap.active, snap.queued, snap.oldest_wait_seconds,
        snap.capacity, available, utils::escape_json(backend_url_));
}

} // namespace lmgate
