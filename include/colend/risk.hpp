#ifndef COLEND_RISK_HPP
#define COLEND_RISK_HPP

#include "types.hpp"

namespace colend {

// =============================================================================
// Risk Parameters
// =============================================================================

struct RiskParams {
    uint64_t minimum_collateral_ratio;   // percent, admission
    uint64_t liquidation_threshold;      // percent, ratio at or below liquidates
    uint64_t fee_rate;                   // percent
    bool initialized;
};

// =============================================================================
// CLRiskParams - Administrator-Mutable Global Thresholds
// =============================================================================

class CLRiskParams {
public:
    CLRiskParams(const Address& admin, uint64_t minimum_ratio,
                 uint64_t liquidation_threshold, uint64_t fee_rate);

    CLRiskParams(const CLRiskParams&) = delete;
    CLRiskParams& operator=(const CLRiskParams&) = delete;

    // One-time transition, administrator only
    int32_t initialize(const Address& caller);
    bool is_initialized() const { return params_.initialized; }

    int32_t set_minimum_ratio(const Address& caller, uint64_t value);
    int32_t set_liquidation_threshold(const Address& caller, uint64_t value);
    int32_t set_fee_rate(const Address& caller, uint64_t value);

    uint64_t minimum_ratio() const { return params_.minimum_collateral_ratio; }
    uint64_t liquidation_threshold() const { return params_.liquidation_threshold; }
    uint64_t fee_rate() const { return params_.fee_rate; }

    RiskParams snapshot() const { return params_; }

    bool is_admin(const Address& caller) const { return caller == admin_; }

private:
    Address admin_;
    RiskParams params_;

    int32_t set_ratio(const Address& caller, uint64_t value, uint64_t& target, const char* name);
};

} // namespace colend

#endif // COLEND_RISK_HPP
