#ifndef COLEND_CLOCK_HPP
#define COLEND_CLOCK_HPP

#include <atomic>
#include <cstdint>
#include <functional>

namespace colend {

// Current time unit (block height) of the external chain. The ledger calls it
// before taking its lock.
using BlockHeightSource = std::function<uint64_t()>;

// =============================================================================
// LogicalClock - Monotonic Time-Unit Counter
// =============================================================================

class LogicalClock {
public:
    explicit LogicalClock(uint64_t start = 0) : height_(start) {}

    LogicalClock(const LogicalClock&) = delete;
    LogicalClock& operator=(const LogicalClock&) = delete;

    uint64_t now() const { return height_.load(std::memory_order_acquire); }

    // Returns the new height
    uint64_t advance(uint64_t units) {
        return height_.fetch_add(units, std::memory_order_acq_rel) + units;
    }

    // Moves forward only; returns false if height is behind the current one
    bool set(uint64_t height) {
        uint64_t current = height_.load(std::memory_order_acquire);
        while (height >= current) {
            if (height_.compare_exchange_weak(current, height, std::memory_order_acq_rel)) {
                return true;
            }
        }
        return false;
    }

    // Source bound to this clock; the clock must outlive it
    BlockHeightSource source() const {
        return [this] { return now(); };
    }

private:
    std::atomic<uint64_t> height_;
};

} // namespace colend

#endif // COLEND_CLOCK_HPP
