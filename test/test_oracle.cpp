// colend - Oracle Price Store Tests

#include <catch2/catch.hpp>
#include <colend/oracle.hpp>

#include "test_helpers.hpp"

using namespace colend;
using namespace colend::test;

TEST_CASE("CLOracle price publication", "[oracle]") {
    CLOracle oracle(ADMIN, "BTC", "STX");

    SECTION("Unset price reads as absent") {
        REQUIRE_FALSE(oracle.get_price("BTC").has_value());
        REQUIRE_FALSE(oracle.collateral_price().has_value());
    }

    SECTION("Administrator publishes, last write wins") {
        REQUIRE(oracle.set_price(ADMIN, "BTC", 50000) == errors::OK);
        REQUIRE(oracle.get_price("BTC").value() == 50000);

        REQUIRE(oracle.set_price(ADMIN, "BTC", 30000) == errors::OK);
        REQUIRE(oracle.collateral_price().value() == 30000);

        REQUIRE(oracle.set_price(ADMIN, "STX", 2) == errors::OK);
        REQUIRE(oracle.get_price("STX").value() == 2);

        auto stats = oracle.get_stats();
        REQUIRE(stats.priced_assets == 2);
        REQUIRE(stats.total_updates == 3);
    }

    SECTION("Non-administrator is rejected") {
        REQUIRE(oracle.set_price(ALICE, "BTC", 50000) == errors::UNAUTHORIZED);
        REQUIRE_FALSE(oracle.get_price("BTC").has_value());
    }

    SECTION("Unrecognized asset is rejected") {
        REQUIRE(oracle.set_price(ADMIN, "ETH", 3000) == errors::INVALID_ASSET);
        REQUIRE_FALSE(oracle.is_recognized("ETH"));
        REQUIRE(oracle.is_recognized("STX"));
    }

    SECTION("Price must be in (0, 1e12]") {
        REQUIRE(oracle.set_price(ADMIN, "BTC", 0) == errors::INVALID_PRICE);
        REQUIRE(oracle.set_price(ADMIN, "BTC", limits::MAX_PRICE + 1) == errors::INVALID_PRICE);
        REQUIRE(oracle.set_price(ADMIN, "BTC", limits::MAX_PRICE) == errors::OK);
        REQUIRE(oracle.get_price("BTC").value() == limits::MAX_PRICE);
    }

    SECTION("Rejected update keeps the previous price") {
        REQUIRE(oracle.set_price(ADMIN, "BTC", 50000) == errors::OK);
        REQUIRE(oracle.set_price(ADMIN, "BTC", 0) == errors::INVALID_PRICE);
        REQUIRE(oracle.get_price("BTC").value() == 50000);
        REQUIRE(oracle.get_stats().total_updates == 1);
    }

    SECTION("Authorization is checked before asset and price") {
        REQUIRE(oracle.check_update(ALICE, "ETH", 0) == errors::UNAUTHORIZED);
        REQUIRE(oracle.check_update(ADMIN, "ETH", 0) == errors::INVALID_ASSET);
    }
}
