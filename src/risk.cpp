// =============================================================================
// risk.cpp - CLRiskParams Global Threshold Store
// =============================================================================

#include "colend/risk.hpp"
#include "colend/logging.hpp"

namespace colend {

CLRiskParams::CLRiskParams(const Address& admin, uint64_t minimum_ratio,
                           uint64_t liquidation_threshold, uint64_t fee_rate)
    : admin_(admin),
      params_{minimum_ratio, liquidation_threshold, fee_rate, false} {}

int32_t CLRiskParams::initialize(const Address& caller) {
    if (!is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (params_.initialized) {
        return errors::ALREADY_INITIALIZED;
    }

    params_.initialized = true;
    log::get()->info("platform initialized (min_ratio={} liq_threshold={} fee_rate={})",
                     params_.minimum_collateral_ratio, params_.liquidation_threshold,
                     params_.fee_rate);
    return errors::OK;
}

int32_t CLRiskParams::set_minimum_ratio(const Address& caller, uint64_t value) {
    return set_ratio(caller, value, params_.minimum_collateral_ratio, "minimum_collateral_ratio");
}

int32_t CLRiskParams::set_liquidation_threshold(const Address& caller, uint64_t value) {
    return set_ratio(caller, value, params_.liquidation_threshold, "liquidation_threshold");
}

int32_t CLRiskParams::set_fee_rate(const Address& caller, uint64_t value) {
    if (!is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (value > limits::MAX_FEE_RATE) {
        return errors::INVALID_AMOUNT;
    }

    params_.fee_rate = value;
    log::get()->info("fee_rate = {}", value);
    return errors::OK;
}

int32_t CLRiskParams::set_ratio(const Address& caller, uint64_t value, uint64_t& target,
                                const char* name) {
    if (!is_admin(caller)) {
        return errors::UNAUTHORIZED;
    }
    // Same floor for both ratios
    if (value < limits::MIN_RATIO_FLOOR) {
        log::get()->debug("{} {} rejected: below {}", name, value, limits::MIN_RATIO_FLOOR);
        return errors::INVALID_AMOUNT;
    }

    target = value;
    log::get()->info("{} = {}", name, value);
    return errors::OK;
}

} // namespace colend
