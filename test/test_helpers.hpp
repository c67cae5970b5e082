// Shared fixtures for colend tests

#ifndef COLEND_TEST_HELPERS_HPP
#define COLEND_TEST_HELPERS_HPP

#include <colend/colend.hpp>

namespace colend::test {

inline const Address ADMIN = addresses::from_index(1);
inline const Address ALICE = addresses::from_index(2);
inline const Address BOB = addresses::from_index(3);

inline LedgerConfig make_config() {
    LedgerConfig config;
    config.admin = ADMIN;
    return config;
}

// Ledger on a manual clock, admin = ADMIN
struct LedgerFixture {
    explicit LedgerFixture(const LedgerConfig& config = make_config())
        : ledger(config, clock.source()) {}

    // initialize + collateral price
    void open_market(uint64_t btc_price) {
        ledger.initialize(ADMIN);
        ledger.set_price(ADMIN, "BTC", btc_price);
    }

    LogicalClock clock;
    CLLedger ledger;
};

}  // namespace colend::test

#endif // COLEND_TEST_HELPERS_HPP
