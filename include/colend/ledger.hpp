#ifndef COLEND_LEDGER_HPP
#define COLEND_LEDGER_HPP

#include <map>
#include <shared_mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "oracle.hpp"
#include "risk.hpp"

namespace colend {

// =============================================================================
// CLLedger - Collateralized Position Ledger
//
// Owns the oracle, risk parameters, positions, per-borrower active index and
// protocol aggregates. Every public operation runs under one lock: mutations
// take it exclusively, check every precondition first, then write. A rejected
// operation leaves no trace. The clock is read before the lock is taken.
// =============================================================================

class CLLedger {
public:
    CLLedger(const LedgerConfig& config, BlockHeightSource clock);
    ~CLLedger() = default;

    // Non-copyable
    CLLedger(const CLLedger&) = delete;
    CLLedger& operator=(const CLLedger&) = delete;

    // =========================================================================
    // Administration
    // =========================================================================

    int32_t initialize(const Address& caller);
    int32_t set_minimum_ratio(const Address& caller, uint64_t value);
    int32_t set_liquidation_threshold(const Address& caller, uint64_t value);
    int32_t set_fee_rate(const Address& caller, uint64_t value);
    int32_t set_price(const Address& caller, std::string_view asset, uint64_t price);

    // =========================================================================
    // Custody Accounting
    // =========================================================================

    // Records collateral already moved in by the custody bridge; not verified here
    int32_t deposit_collateral(const Address& caller, uint64_t amount);

    // =========================================================================
    // Position Lifecycle
    // =========================================================================

    CLLoanResult request_loan(const Address& caller, uint64_t collateral, uint64_t debt);

    // Full settlement only: amount must cover principal plus accrued interest
    int32_t repay(const Address& caller, uint64_t loan_id, uint64_t amount);

    // Idempotent. Liquidates when ratio <= liquidation threshold.
    CLLiquidationCheck check_liquidation(uint64_t loan_id);

    // Runs check_liquidation over every active position in one transaction
    int32_t run_liquidations(std::vector<uint64_t>& liquidated);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<CLPosition> get_position(uint64_t loan_id) const;
    std::vector<uint64_t> get_user_positions(const Address& user) const;

    // Principal plus interest at the current height; active positions only
    std::optional<U128> amount_owed(uint64_t loan_id) const;

    // Collateral ratio at the current collateral price
    std::optional<U128> health_ratio(uint64_t loan_id) const;

    std::optional<uint64_t> get_price(std::string_view asset) const;
    RiskParams get_risk_params() const;

    struct Stats {
        uint64_t total_collateral_locked;
        uint64_t total_collateral_deposited;
        uint64_t total_positions_issued;
        uint64_t active_positions;
        uint64_t total_repaid;
        uint64_t total_liquidations;
        uint64_t total_interest_collected;
    };
    Stats get_stats() const;

    // True when total_collateral_locked matches the configured accounting policy
    bool audit_aggregates() const;

    const LedgerConfig& config() const { return config_; }
    uint64_t now() const;

private:
    LedgerConfig config_;
    BlockHeightSource clock_;

    CLOracle oracle_;
    CLRiskParams risk_;

    // loan_id -> position, retained after settlement
    std::map<uint64_t, CLPosition> positions_;

    // borrower -> active loan ids in opening order
    std::map<Address, std::vector<uint64_t>> user_index_;

    Stats stats_{};
    uint64_t next_id_{1};

    mutable std::shared_mutex state_mutex_;

    // Callers hold state_mutex_
    int32_t find_position(uint64_t loan_id, CLPosition*& out);
    void remove_from_index(const Address& borrower, uint64_t loan_id);
    void clear_index(const Address& borrower);
    void apply_liquidation(CLPosition& position);
};

} // namespace colend

#endif // COLEND_LEDGER_HPP
