#include "admission/admission_gate.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace lmgate {

AdmissionGate::AdmissionGate(uint32_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("AdmissionGate capacity must be at least 1");
    }
}

bool AdmissionGate::try_acquire() {
    uint32_t current = active_.load(std::memory_order_relaxed);
    do {
        if (current >= capacity_) {
            return false;
        }
    } while (!active_.compare_exchange_weak(current, current + 1,
                                            std::memory_order_acq_rel,
                                            std::memory_order_relaxed));
    acquired_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void AdmissionGate::release() {
    uint32_t current = active_.load(std::memory_order_relaxed);
    do {
        if (current == 0) {
            const auto msg = std::format(
                "AdmissionGate invariant violated: release() with active=0 "
                "(acquired={}, released={})",
                acquired_.load(std::memory_order_relaxed),
                released_.load(std::memory_order_relaxed));
            utils::log::error(msg);
            throw std::logic_error(msg);
        }
    } while (!active_.compare_exchange_weak(current, current - 1,
                                            std::memory_order_acq_rel,
                                            std::memory_order_relaxed));
    released_.fetch_add(1, std::memory_order_relaxed);
}

AdmissionGate::Stats AdmissionGate::get_stats() const {
    return {
        .acquired = acquired_.load(std::memory_order_relaxed),
        .released = released_.load(std::memory_order_relaxed),
        .active = active_.load(std::memory_order_relaxed),
        .capacity = capacity_,
    };
}

} // namespace lmgate
