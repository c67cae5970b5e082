#ifndef COLEND_COLEND_HPP
#define COLEND_COLEND_HPP

// =============================================================================
// colend - Collateral-Backed Lending Ledger
//
//   CLOracle     single authoritative quote per asset
//   CLRiskParams administrator-mutable thresholds and init flag
//   health::     ratio, interest and liquidation math
//   CLLedger     positions, borrower index, aggregates
//
// =============================================================================

#include "types.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "oracle.hpp"
#include "risk.hpp"
#include "health.hpp"
#include "ledger.hpp"

namespace colend {

constexpr const char* version() { return "1.0.0"; }

} // namespace colend

#endif // COLEND_COLEND_HPP
