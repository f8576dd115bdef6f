#pragma once

#include <functional>

namespace lmgate {

/**
 * @brief RAII ownership of one admitted backend slot
 *
 * Releases the slot exactly once: either explicitly via release() or on
 * destruction. Move-only to prevent accidental double release.
 */
class SlotLease {
public:
    using ReleaseFunc = std::function<void()>;

    SlotLease() = default;
    explicit SlotLease(ReleaseFunc release_fn);

    /**
     * @brief Destructor - returns the slot if still held
     *
     * A failing release here is an internal-consistency error; it is
     * logged and terminates the process.
     */
    ~SlotLease();

    SlotLease(SlotLease&& other) noexcept;
    SlotLease& operator=(SlotLease&& other) noexcept;

    SlotLease(const SlotLease&) = delete;
    SlotLease& operator=(const SlotLease&) = delete;

    /**
     * @brief Release now. No-op if already released.
     * @throws std::logic_error propagated from the gate
     */
    void release();

    [[nodiscard]] bool held() const { return static_cast<bool>(release_fn_); }

private:
    void release_or_terminate() noexcept;

    ReleaseFunc release_fn_;
};

} // namespace lmgate
