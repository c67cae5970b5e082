// =============================================================================
// ledger.cpp - CLLedger Position State Machine
// =============================================================================

#include "colend/ledger.hpp"
#include "colend/health.hpp"
#include "colend/logging.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace colend {

// =============================================================================
// Constructor
// =============================================================================

CLLedger::CLLedger(const LedgerConfig& config, BlockHeightSource clock)
    : config_(config),
      clock_(std::move(clock)),
      oracle_(config.admin, config.collateral_asset, config.secondary_asset),
      risk_(config.admin, config.minimum_collateral_ratio,
            config.liquidation_threshold, config.fee_rate) {
    config_.validate();
}

uint64_t CLLedger::now() const {
    return clock_ ? clock_() : 0;
}

// =============================================================================
// Administration
// =============================================================================

int32_t CLLedger::initialize(const Address& caller) {
    std::unique_lock lock(state_mutex_);
    return risk_.initialize(caller);
}

int32_t CLLedger::set_minimum_ratio(const Address& caller, uint64_t value) {
    std::unique_lock lock(state_mutex_);
    return risk_.set_minimum_ratio(caller, value);
}

int32_t CLLedger::set_liquidation_threshold(const Address& caller, uint64_t value) {
    std::unique_lock lock(state_mutex_);
    return risk_.set_liquidation_threshold(caller, value);
}

int32_t CLLedger::set_fee_rate(const Address& caller, uint64_t value) {
    std::unique_lock lock(state_mutex_);
    return risk_.set_fee_rate(caller, value);
}

int32_t CLLedger::set_price(const Address& caller, std::string_view asset, uint64_t price) {
    std::unique_lock lock(state_mutex_);
    return oracle_.set_price(caller, asset, price);
}

// =============================================================================
// Custody Accounting
// =============================================================================

int32_t CLLedger::deposit_collateral(const Address& caller, uint64_t amount) {
    std::unique_lock lock(state_mutex_);

    if (!risk_.is_initialized()) {
        return errors::NOT_INITIALIZED;
    }
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    uint64_t deposited = 0;
    uint64_t locked = stats_.total_collateral_locked;
    if (!u128::add(stats_.total_collateral_deposited, amount, deposited)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    if (config_.legacy_deposit_accounting &&
        !u128::add(stats_.total_collateral_locked, amount, locked)) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    stats_.total_collateral_deposited = deposited;
    stats_.total_collateral_locked = locked;

    log::get()->info("deposit {} from {} (locked={})",
                     amount, addresses::to_hex(caller), locked);
    return errors::OK;
}

// =============================================================================
// Position Lifecycle
// =============================================================================

CLLoanResult CLLedger::request_loan(const Address& caller, uint64_t collateral, uint64_t debt) {
    uint64_t height = now();
    std::unique_lock lock(state_mutex_);

    auto reject = [&](int32_t code) {
        log::get()->debug("request_loan from {} rejected: {}",
                          addresses::to_hex(caller), errors::to_string(code));
        return CLLoanResult{code, 0};
    };

    if (!risk_.is_initialized()) {
        return reject(errors::NOT_INITIALIZED);
    }
    if (collateral == 0 || debt == 0) {
        return reject(errors::INVALID_AMOUNT);
    }
    if (debt < config_.min_debt_amount) {
        return reject(errors::BELOW_MINIMUM);
    }

    auto price = oracle_.collateral_price();
    if (!price) {
        return reject(errors::NOT_INITIALIZED);
    }
    if (!health::meets_minimum(collateral, *price, debt, risk_.minimum_ratio())) {
        return reject(errors::INSUFFICIENT_COLLATERAL);
    }

    auto index_it = user_index_.find(caller);
    if (index_it != user_index_.end() &&
        index_it->second.size() >= config_.max_active_positions) {
        return reject(errors::INVALID_AMOUNT);
    }

    uint64_t issued = 0;
    uint64_t active = 0;
    uint64_t locked = stats_.total_collateral_locked;
    if (!u128::add(stats_.total_positions_issued, 1, issued) ||
        !u128::add(stats_.active_positions, 1, active)) {
        return reject(errors::ARITHMETIC_OVERFLOW);
    }
    if (!config_.legacy_deposit_accounting &&
        !u128::add(stats_.total_collateral_locked, collateral, locked)) {
        return reject(errors::ARITHMETIC_OVERFLOW);
    }

    // All checks passed; commit
    uint64_t loan_id = next_id_++;

    CLPosition position;
    position.id = loan_id;
    position.borrower = caller;
    position.collateral_amount = collateral;
    position.debt_amount = debt;
    position.interest_rate = config_.interest_rate;
    position.opened_at = height;
    position.last_accrual_at = height;
    position.status = PositionStatus::ACTIVE;
    positions_.emplace(loan_id, position);

    user_index_[caller].push_back(loan_id);

    stats_.total_positions_issued = issued;
    stats_.active_positions = active;
    stats_.total_collateral_locked = locked;

    log::get()->info("loan {} opened by {}: collateral={} debt={} rate={} at={}",
                     loan_id, addresses::to_hex(caller), collateral, debt,
                     position.interest_rate, height);
    return CLLoanResult{errors::OK, loan_id};
}

int32_t CLLedger::repay(const Address& caller, uint64_t loan_id, uint64_t amount) {
    uint64_t height = now();
    std::unique_lock lock(state_mutex_);

    if (!risk_.is_initialized()) {
        return errors::NOT_INITIALIZED;
    }

    CLPosition* position = nullptr;
    int32_t rc = find_position(loan_id, position);
    if (rc != errors::OK) {
        return rc;
    }
    if (!position->is_active()) {
        return errors::LOAN_NOT_ACTIVE;
    }
    if (position->borrower != caller) {
        return errors::UNAUTHORIZED;
    }

    auto owed = health::amount_owed(position->debt_amount, position->interest_rate,
                                    health::elapsed(height, position->last_accrual_at));
    if (!owed || static_cast<U128>(amount) < *owed) {
        log::get()->debug("repay {} rejected: amount {} below owed {}", loan_id, amount,
                          owed ? u128::to_string(*owed) : std::string("overflow"));
        return errors::INVALID_AMOUNT;
    }

    // owed <= amount, so interest fits in 64 bits
    uint64_t interest = static_cast<uint64_t>(*owed - position->debt_amount);

    uint64_t locked = 0;
    uint64_t active = 0;
    uint64_t repaid = 0;
    uint64_t interest_total = 0;
    if (!u128::sub(stats_.total_collateral_locked, position->collateral_amount, locked) ||
        !u128::sub(stats_.active_positions, 1, active) ||
        !u128::add(stats_.total_repaid, 1, repaid) ||
        !u128::add(stats_.total_interest_collected, interest, interest_total)) {
        log::get()->debug("repay {} rejected: aggregate out of range", loan_id);
        return errors::ARITHMETIC_OVERFLOW;
    }

    position->status = PositionStatus::REPAID;
    position->last_accrual_at = height;
    remove_from_index(caller, loan_id);

    stats_.total_collateral_locked = locked;
    stats_.active_positions = active;
    stats_.total_repaid = repaid;
    stats_.total_interest_collected = interest_total;

    log::get()->info("loan {} repaid by {}: paid={} interest={}",
                     loan_id, addresses::to_hex(caller), amount, interest);
    return errors::OK;
}

CLLiquidationCheck CLLedger::check_liquidation(uint64_t loan_id) {
    std::unique_lock lock(state_mutex_);

    CLLiquidationCheck result{errors::OK, false, 0};

    if (!risk_.is_initialized()) {
        result.status = errors::NOT_INITIALIZED;
        return result;
    }

    CLPosition* position = nullptr;
    result.status = find_position(loan_id, position);
    if (result.status != errors::OK) {
        return result;
    }

    switch (position->status) {
        case PositionStatus::LIQUIDATED:
            return result;
        case PositionStatus::REPAID:
            result.status = errors::LOAN_NOT_ACTIVE;
            return result;
        case PositionStatus::ACTIVE:
            break;
    }

    auto price = oracle_.collateral_price();
    if (!price) {
        result.status = errors::NOT_INITIALIZED;
        return result;
    }

    result.ratio = health::collateral_ratio(position->collateral_amount, *price,
                                            position->debt_amount);
    if (health::is_healthy(*position, *price, risk_.liquidation_threshold())) {
        return result;
    }

    uint64_t locked = stats_.total_collateral_locked;
    uint64_t active = 0;
    uint64_t liquidations = 0;
    if ((!config_.legacy_deposit_accounting &&
         !u128::sub(stats_.total_collateral_locked, position->collateral_amount, locked)) ||
        !u128::sub(stats_.active_positions, 1, active) ||
        !u128::add(stats_.total_liquidations, 1, liquidations)) {
        result.status = errors::ARITHMETIC_OVERFLOW;
        return result;
    }

    apply_liquidation(*position);

    stats_.total_collateral_locked = locked;
    stats_.active_positions = active;
    stats_.total_liquidations = liquidations;

    result.liquidated = true;
    log::get()->info("loan {} liquidated: ratio={} threshold={} price={}",
                     loan_id, u128::to_string(result.ratio),
                     risk_.liquidation_threshold(), *price);
    return result;
}

int32_t CLLedger::run_liquidations(std::vector<uint64_t>& liquidated) {
    std::unique_lock lock(state_mutex_);

    liquidated.clear();

    if (!risk_.is_initialized()) {
        return errors::NOT_INITIALIZED;
    }
    auto price = oracle_.collateral_price();
    if (!price) {
        return errors::NOT_INITIALIZED;
    }

    uint64_t threshold = risk_.liquidation_threshold();
    std::vector<CLPosition*> unhealthy;
    U128 released = 0;
    for (auto& [id, position] : positions_) {
        if (position.is_active() && !health::is_healthy(position, *price, threshold)) {
            unhealthy.push_back(&position);
            released += position.collateral_amount;
        }
    }

    uint64_t locked = stats_.total_collateral_locked;
    if (!config_.legacy_deposit_accounting) {
        if (released > stats_.total_collateral_locked) {
            return errors::ARITHMETIC_OVERFLOW;
        }
        locked = stats_.total_collateral_locked - static_cast<uint64_t>(released);
    }
    uint64_t active = 0;
    uint64_t liquidations = 0;
    if (!u128::sub(stats_.active_positions, static_cast<uint64_t>(unhealthy.size()), active) ||
        !u128::add(stats_.total_liquidations, static_cast<uint64_t>(unhealthy.size()), liquidations)) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    for (CLPosition* position : unhealthy) {
        apply_liquidation(*position);
        liquidated.push_back(position->id);
    }

    stats_.total_collateral_locked = locked;
    stats_.active_positions = active;
    stats_.total_liquidations = liquidations;

    log::get()->info("liquidation sweep at price {}: {} position(s) liquidated",
                     *price, liquidated.size());
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<CLPosition> CLLedger::get_position(uint64_t loan_id) const {
    std::shared_lock lock(state_mutex_);
    auto it = positions_.find(loan_id);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::vector<uint64_t> CLLedger::get_user_positions(const Address& user) const {
    std::shared_lock lock(state_mutex_);
    auto it = user_index_.find(user);
    if (it == user_index_.end()) return {};
    return it->second;
}

std::optional<U128> CLLedger::amount_owed(uint64_t loan_id) const {
    uint64_t height = now();
    std::shared_lock lock(state_mutex_);
    auto it = positions_.find(loan_id);
    if (it == positions_.end() || !it->second.is_active()) return std::nullopt;

    const CLPosition& position = it->second;
    return health::amount_owed(position.debt_amount, position.interest_rate,
                               health::elapsed(height, position.last_accrual_at));
}

std::optional<U128> CLLedger::health_ratio(uint64_t loan_id) const {
    std::shared_lock lock(state_mutex_);
    auto it = positions_.find(loan_id);
    if (it == positions_.end() || !it->second.is_active()) return std::nullopt;

    auto price = oracle_.collateral_price();
    if (!price) return std::nullopt;

    return health::collateral_ratio(it->second.collateral_amount, *price,
                                    it->second.debt_amount);
}

std::optional<uint64_t> CLLedger::get_price(std::string_view asset) const {
    std::shared_lock lock(state_mutex_);
    return oracle_.get_price(asset);
}

RiskParams CLLedger::get_risk_params() const {
    std::shared_lock lock(state_mutex_);
    return risk_.snapshot();
}

CLLedger::Stats CLLedger::get_stats() const {
    std::shared_lock lock(state_mutex_);
    return stats_;
}

bool CLLedger::audit_aggregates() const {
    std::shared_lock lock(state_mutex_);

    if (!config_.legacy_deposit_accounting) {
        U128 active_collateral = 0;
        for (const auto& [id, position] : positions_) {
            if (position.is_active()) active_collateral += position.collateral_amount;
        }
        return active_collateral == stats_.total_collateral_locked;
    }

    // Legacy: deposits in, repaid collateral out, liquidations untouched
    U128 repaid_collateral = 0;
    for (const auto& [id, position] : positions_) {
        if (position.status == PositionStatus::REPAID) {
            repaid_collateral += position.collateral_amount;
        }
    }
    if (repaid_collateral > stats_.total_collateral_deposited) return false;
    return stats_.total_collateral_deposited - repaid_collateral == stats_.total_collateral_locked;
}

// =============================================================================
// Internal Helpers
// =============================================================================

int32_t CLLedger::find_position(uint64_t loan_id, CLPosition*& out) {
    if (loan_id == 0) {
        return errors::INVALID_LOAN_ID;
    }
    auto it = positions_.find(loan_id);
    if (it == positions_.end()) {
        return errors::LOAN_NOT_FOUND;
    }
    out = &it->second;
    return errors::OK;
}

void CLLedger::remove_from_index(const Address& borrower, uint64_t loan_id) {
    auto it = user_index_.find(borrower);
    if (it == user_index_.end()) return;

    auto& ids = it->second;
    ids.erase(std::remove(ids.begin(), ids.end(), loan_id), ids.end());
    if (ids.empty()) {
        user_index_.erase(it);
    }
}

void CLLedger::clear_index(const Address& borrower) {
    auto it = user_index_.find(borrower);
    if (it == user_index_.end()) return;

    if (it->second.size() > 1) {
        log::get()->warn("clearing {} active index entries of {} on liquidation",
                         it->second.size(), addresses::to_hex(borrower));
    }
    user_index_.erase(it);
}

void CLLedger::apply_liquidation(CLPosition& position) {
    position.status = PositionStatus::LIQUIDATED;
    if (config_.clear_index_on_liquidation) {
        clear_index(position.borrower);
    } else {
        remove_from_index(position.borrower, position.id);
    }
}

} // namespace colend
