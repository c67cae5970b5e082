// =============================================================================
// health.cpp - Collateral Ratio, Interest and Liquidation Rule
// =============================================================================

#include "colend/health.hpp"

namespace colend {
namespace health {

namespace {
constexpr U128 U128_MAX = ~static_cast<U128>(0);
}

U128 collateral_ratio(uint64_t collateral, uint64_t price, uint64_t debt) {
    U128 value = static_cast<U128>(collateral) * price;
    U128 quotient = value / debt;
    if (quotient > U128_MAX / 100) {
        return U128_MAX;
    }
    return quotient * 100;
}

std::optional<U128> interest_owed(uint64_t principal, uint64_t rate, uint64_t elapsed_units) {
    U128 per_unit = (static_cast<U128>(principal) * rate) / (100 * limits::UNITS_PER_PERIOD);
    if (elapsed_units != 0 && per_unit > U128_MAX / elapsed_units) {
        return std::nullopt;
    }
    return per_unit * elapsed_units;
}

std::optional<U128> amount_owed(uint64_t principal, uint64_t rate, uint64_t elapsed_units) {
    auto interest = interest_owed(principal, rate, elapsed_units);
    if (!interest || *interest > U128_MAX - principal) {
        return std::nullopt;
    }
    return static_cast<U128>(principal) + *interest;
}

bool meets_minimum(uint64_t collateral, uint64_t price, uint64_t debt, uint64_t minimum_ratio) {
    U128 value = static_cast<U128>(collateral) * price;
    U128 required = static_cast<U128>(debt) * minimum_ratio;
    // value * 100 past 128 bits exceeds any 128-bit requirement
    if (value > U128_MAX / 100) {
        return true;
    }
    return value * 100 >= required;
}

bool is_healthy(const CLPosition& position, uint64_t price, uint64_t threshold) {
    return collateral_ratio(position.collateral_amount, price, position.debt_amount) > threshold;
}

} // namespace health
} // namespace colend
