#include "admission/slot_lease.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <utility>

namespace lmgate {

SlotLease::SlotLease(ReleaseFunc release_fn)
    : release_fn_(std::move(release_fn)) {}

SlotLease::~SlotLease() {
    release_or_terminate();
}

SlotLease::SlotLease(SlotLease&& other) noexcept
    : release_fn_(std::exchange(other.release_fn_, nullptr)) {}

SlotLease& SlotLease::operator=(SlotLease&& other) noexcept {
    if (this != &other) {
        // Return the slot we hold before taking the other one
        release_or_terminate();
        release_fn_ = std::exchange(other.release_fn_, nullptr);
    }
    return *this;
}

void SlotLease::release() {
    if (!release_fn_) return;
    // Clear first so a throwing release is never retried
    auto fn = std::exchange(release_fn_, nullptr);
    fn();
}

void SlotLease::release_or_terminate() noexcept {
    try {
        release();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: slot release failed: {}", e.what()));
        std::terminate();
    }
}

} // namespace lmgate
