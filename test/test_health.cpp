// colend - Admission & Health Math Tests

#include <catch2/catch.hpp>
#include <colend/health.hpp>

using namespace colend;

namespace {

CLPosition make_position(uint64_t collateral, uint64_t debt) {
    CLPosition p{};
    p.id = 1;
    p.collateral_amount = collateral;
    p.debt_amount = debt;
    p.interest_rate = limits::DEFAULT_INTEREST_RATE;
    p.status = PositionStatus::ACTIVE;
    return p;
}

}  // namespace

TEST_CASE("Collateral ratio", "[health]") {
    SECTION("Whole multiples") {
        REQUIRE(static_cast<uint64_t>(health::collateral_ratio(10, 30000, 300000)) == 100);
        REQUIRE(static_cast<uint64_t>(health::collateral_ratio(10, 50000, 300000)) == 100);
        REQUIRE(static_cast<uint64_t>(health::collateral_ratio(2, 150, 100)) == 300);
    }

    SECTION("Quotient truncates before scaling") {
        // 199 / 100 = 1.99 -> 1 -> 100
        REQUIRE(static_cast<uint64_t>(health::collateral_ratio(1, 199, 100)) == 100);
        REQUIRE(static_cast<uint64_t>(health::collateral_ratio(1, 99, 100)) == 0);
    }

    SECTION("Products beyond 64 bits do not wrap") {
        U128 ratio = health::collateral_ratio(UINT64_MAX, limits::MAX_PRICE, UINT64_MAX);
        REQUIRE(ratio == static_cast<U128>(limits::MAX_PRICE) * 100);
    }

    SECTION("Saturates instead of overflowing") {
        U128 ratio = health::collateral_ratio(UINT64_MAX, UINT64_MAX, 1);
        REQUIRE(ratio == ~static_cast<U128>(0));
    }
}

TEST_CASE("Interest owed", "[health]") {
    SECTION("Zero elapsed accrues nothing") {
        REQUIRE(health::interest_owed(300000, 5, 0).value() == 0);
    }

    SECTION("Per-unit interest is truncated, then scaled by elapsed units") {
        // 300000 * 5 / 14400 = 104.16 -> 104
        REQUIRE(static_cast<uint64_t>(health::interest_owed(300000, 5, 1).value()) == 104);
        REQUIRE(static_cast<uint64_t>(health::interest_owed(300000, 5, 10).value()) == 1040);
        REQUIRE(static_cast<uint64_t>(health::interest_owed(300000, 5, 144).value()) == 14976);
    }

    SECTION("Small principals round to zero") {
        REQUIRE(health::interest_owed(100, 5, 1000).value() == 0);
    }

    SECTION("Amount owed adds principal") {
        REQUIRE(static_cast<uint64_t>(health::amount_owed(300000, 5, 10).value()) == 301040);
    }

    SECTION("Unrepresentable interest is reported") {
        REQUIRE_FALSE(health::interest_owed(UINT64_MAX, UINT64_MAX, UINT64_MAX).has_value());
        REQUIRE_FALSE(health::amount_owed(UINT64_MAX, UINT64_MAX, UINT64_MAX).has_value());
    }
}

TEST_CASE("Admission rule", "[health]") {
    SECTION("Concrete scenario admits") {
        // 10 * 50000 * 100 = 50,000,000 >= 300000 * 150 = 45,000,000
        REQUIRE(health::meets_minimum(10, 50000, 300000, 150));
    }

    SECTION("Exact boundary admits") {
        // 1 * 150 * 100 == 100 * 150
        REQUIRE(health::meets_minimum(1, 150, 100, 150));
        REQUIRE_FALSE(health::meets_minimum(1, 150, 101, 150));
    }

    SECTION("Huge collateral value never wraps into a rejection") {
        REQUIRE(health::meets_minimum(UINT64_MAX, UINT64_MAX, UINT64_MAX, UINT64_MAX));
    }
}

TEST_CASE("Liquidation rule", "[health]") {
    CLPosition position = make_position(2, 100);

    SECTION("Ratio equal to threshold is unhealthy") {
        // ratio = floor(2 * 100 / 100) * 100 = 200
        REQUIRE_FALSE(health::is_healthy(position, 100, 200));
    }

    SECTION("Ratio above threshold is healthy") {
        // ratio = 300
        REQUIRE(health::is_healthy(position, 150, 200));
    }

    SECTION("Ratio below threshold is unhealthy") {
        REQUIRE_FALSE(health::is_healthy(position, 50, 120));
    }
}

TEST_CASE("Elapsed units", "[health]") {
    REQUIRE(health::elapsed(10, 4) == 6);
    REQUIRE(health::elapsed(4, 4) == 0);
    REQUIRE(health::elapsed(3, 4) == 0);
}
