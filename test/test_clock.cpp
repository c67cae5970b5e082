// colend - Logical Clock Tests

#include <catch2/catch.hpp>
#include <colend/clock.hpp>

using namespace colend;

TEST_CASE("LogicalClock", "[clock]") {
    LogicalClock clock(100);

    SECTION("Advance moves forward") {
        REQUIRE(clock.now() == 100);
        REQUIRE(clock.advance(44) == 144);
        REQUIRE(clock.now() == 144);
    }

    SECTION("Set never moves backwards") {
        REQUIRE(clock.set(200));
        REQUIRE(clock.now() == 200);
        REQUIRE_FALSE(clock.set(150));
        REQUIRE(clock.now() == 200);
        REQUIRE(clock.set(200));
    }

    SECTION("Source reads the live height") {
        BlockHeightSource source = clock.source();
        REQUIRE(source() == 100);
        clock.advance(1);
        REQUIRE(source() == 101);
    }
}
