#ifndef COLEND_CONFIG_HPP
#define COLEND_CONFIG_HPP

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace colend {

// =============================================================================
// LedgerConfig
//
// Everything the ledger needs at construction. Copied into the ledger, never
// read from globals. Loaders throw std::runtime_error on bad input.
// =============================================================================

struct LedgerConfig {
    Address admin{};
    std::string collateral_asset = "BTC";
    std::string secondary_asset = "STX";

    uint64_t minimum_collateral_ratio = limits::DEFAULT_MIN_RATIO;
    uint64_t liquidation_threshold = limits::DEFAULT_LIQUIDATION_THRESHOLD;
    uint64_t fee_rate = limits::DEFAULT_FEE_RATE;
    uint64_t interest_rate = limits::DEFAULT_INTEREST_RATE;
    uint64_t min_debt_amount = 1;
    size_t max_active_positions = limits::MAX_ACTIVE_POSITIONS;

    // Liquidation drops the borrower's whole active index instead of one id
    bool clear_index_on_liquidation = false;
    // Locked total follows deposits and repayments instead of position lifecycle
    bool legacy_deposit_accounting = false;

    std::string log_level = "info";

    static LedgerConfig from_file(std::string_view path);
    static LedgerConfig from_json_string(std::string_view content);
    static LedgerConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    // Throws std::runtime_error describing the first invalid field
    void validate() const;
};

} // namespace colend

#endif // COLEND_CONFIG_HPP
