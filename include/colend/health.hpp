#ifndef COLEND_HEALTH_HPP
#define COLEND_HEALTH_HPP

#include <optional>

#include "types.hpp"

namespace colend {

// =============================================================================
// Admission & Health Math
//
// Pure integer functions. All products are widened to 128 bits, all divisions
// truncate, so rounding loss always lands on the protocol side.
// =============================================================================

namespace health {

// floor(collateral * price / debt) * 100, saturating. debt must be non-zero.
U128 collateral_ratio(uint64_t collateral, uint64_t price, uint64_t debt);

// floor(principal * rate / (100 * UNITS_PER_PERIOD)) * elapsed.
// nullopt when the result does not fit in 128 bits.
std::optional<U128> interest_owed(uint64_t principal, uint64_t rate, uint64_t elapsed_units);

// principal + interest_owed(...)
std::optional<U128> amount_owed(uint64_t principal, uint64_t rate, uint64_t elapsed_units);

// collateral * price * 100 >= debt * minimum_ratio (boundary admits)
bool meets_minimum(uint64_t collateral, uint64_t price, uint64_t debt, uint64_t minimum_ratio);

// Ratio strictly above threshold
bool is_healthy(const CLPosition& position, uint64_t price, uint64_t threshold);

// Elapsed units since last accrual, zero if the clock reads behind it
inline uint64_t elapsed(uint64_t now, uint64_t last_accrual_at) {
    return now > last_accrual_at ? now - last_accrual_at : 0;
}

} // namespace health

} // namespace colend

#endif // COLEND_HEALTH_HPP
