#pragma once

#include "admission/request_queue.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace lmgate {

/**
 * @brief Saturation snapshot. Derived on demand, never stored.
 */
struct StatusSnapshot {
    uint32_t capacity = 0;
    uint32_t active = 0;
    size_t queued = 0;
    double oldest_wait_seconds = 0.0;   // 0 when nothing is queued

    bool operator==(const StatusSnapshot&) const = default;
};

/**
 * @brief Read-only view over the admission state
 *
 * Safe to call concurrently with admission and release at any time.
 */
class StatusReporter {
public:
    StatusReporter(std::shared_ptr<const RequestQueue> queue, std::string backend_url);

    /**
     * @brief Snapshot with oldest_wait_seconds measured against `now`
     *
     * Two calls with the same `now` and no admission or release in between
     * return identical snapshots.
     */
    [[nodiscard]] StatusSnapshot snapshot(std::chrono::steady_clock::time_point now) const;
    [[nodiscard]] StatusSnapshot snapshot() const {
        return snapshot(std::chrono::steady_clock::now());
    }

    /**
     * @brief GET /v1/queue/status body
     *
     * {capacity, active, queued, oldest_wait_seconds} plus max_concurrent,
     * available_slots and backend_url.
     */
    [[nodiscard]] std::string to_json(const StatusSnapshot& snap) const;

    /**
     * @brief The four core fields only, for embedding in /health
     */
    [[nodiscard]] static std::string core_fields_json(const StatusSnapshot& snap);

private:
    std::shared_ptr<const RequestQueue> queue_;
    const std::string backend_url_;
};

} // namespace lmgate
