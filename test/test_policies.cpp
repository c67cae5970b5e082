// colend - Index-Clearing and Deposit-Accounting Policy Tests

#include <catch2/catch.hpp>

#include <vector>

#include "test_helpers.hpp"

using namespace colend;
using namespace colend::test;

namespace {

// Loan 1 goes under at 30000, loan 2 stays healthy
void open_two_loans(LedgerFixture& f) {
    f.open_market(50000);
    REQUIRE(f.ledger.request_loan(ALICE, 10, 300000).loan_id == 1);
    REQUIRE(f.ledger.request_loan(ALICE, 100, 300000).loan_id == 2);
    REQUIRE(f.ledger.set_price(ADMIN, "BTC", 30000) == errors::OK);
}

}  // namespace

TEST_CASE("Liquidation removes only the liquidated id by default", "[policy]") {
    LedgerFixture f;
    open_two_loans(f);

    REQUIRE(f.ledger.check_liquidation(1).liquidated);
    REQUIRE(f.ledger.get_user_positions(ALICE) == std::vector<uint64_t>{2});
    REQUIRE(f.ledger.get_position(2)->status == PositionStatus::ACTIVE);

    REQUIRE(f.ledger.repay(ALICE, 2, 300000) == errors::OK);
    REQUIRE(f.ledger.get_user_positions(ALICE).empty());
}

TEST_CASE("Clear-on-liquidation drops the whole borrower index", "[policy]") {
    LedgerConfig config = make_config();
    config.clear_index_on_liquidation = true;
    LedgerFixture f(config);
    open_two_loans(f);

    REQUIRE(f.ledger.check_liquidation(1).liquidated);
    REQUIRE(f.ledger.get_user_positions(ALICE).empty());

    // The other position is still active and still repayable
    REQUIRE(f.ledger.get_position(2)->status == PositionStatus::ACTIVE);
    REQUIRE(f.ledger.repay(ALICE, 2, 300000) == errors::OK);
    REQUIRE(f.ledger.get_user_positions(ALICE).empty());
    REQUIRE(f.ledger.audit_aggregates());
}

TEST_CASE("Lifecycle accounting keeps deposits separate", "[policy]") {
    LedgerFixture f;
    f.open_market(50000);

    REQUIRE(f.ledger.deposit_collateral(ALICE, 100) == errors::OK);
    auto stats = f.ledger.get_stats();
    REQUIRE(stats.total_collateral_deposited == 100);
    REQUIRE(stats.total_collateral_locked == 0);

    REQUIRE(f.ledger.request_loan(ALICE, 10, 300000).loan_id == 1);
    REQUIRE(f.ledger.get_stats().total_collateral_locked == 10);
    REQUIRE(f.ledger.audit_aggregates());
}

TEST_CASE("Legacy deposit accounting", "[policy]") {
    LedgerConfig config = make_config();
    config.legacy_deposit_accounting = true;
    LedgerFixture f(config);
    f.open_market(50000);

    SECTION("Deposits feed the locked total, loans do not") {
        REQUIRE(f.ledger.deposit_collateral(ALICE, 100) == errors::OK);
        REQUIRE(f.ledger.get_stats().total_collateral_locked == 100);

        REQUIRE(f.ledger.request_loan(ALICE, 10, 300000).loan_id == 1);
        REQUIRE(f.ledger.get_stats().total_collateral_locked == 100);

        REQUIRE(f.ledger.repay(ALICE, 1, 300000) == errors::OK);
        REQUIRE(f.ledger.get_stats().total_collateral_locked == 90);
        REQUIRE(f.ledger.audit_aggregates());
    }

    SECTION("Liquidation leaves the locked total untouched") {
        REQUIRE(f.ledger.deposit_collateral(ALICE, 100) == errors::OK);
        REQUIRE(f.ledger.request_loan(ALICE, 10, 300000).loan_id == 1);
        REQUIRE(f.ledger.set_price(ADMIN, "BTC", 30000) == errors::OK);

        REQUIRE(f.ledger.check_liquidation(1).liquidated);
        REQUIRE(f.ledger.get_stats().total_collateral_locked == 100);
        REQUIRE(f.ledger.audit_aggregates());
    }

    SECTION("Repayment that would drive the total below zero is rejected whole") {
        REQUIRE(f.ledger.request_loan(ALICE, 10, 300000).loan_id == 1);
        REQUIRE(f.ledger.repay(ALICE, 1, 300000) == errors::ARITHMETIC_OVERFLOW);

        REQUIRE(f.ledger.get_position(1)->status == PositionStatus::ACTIVE);
        REQUIRE(f.ledger.get_user_positions(ALICE) == std::vector<uint64_t>{1});
        REQUIRE(f.ledger.get_stats().total_repaid == 0);

        REQUIRE(f.ledger.deposit_collateral(ALICE, 10) == errors::OK);
        REQUIRE(f.ledger.repay(ALICE, 1, 300000) == errors::OK);
        REQUIRE(f.ledger.get_stats().total_collateral_locked == 0);
    }
}
