#ifndef COLEND_TYPES_HPP
#define COLEND_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>
#include <optional>

namespace colend {

// =============================================================================
// Identity (20-byte account address)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Parse "0x"-prefixed or bare 40-digit hex. Returns nullopt on bad input.
std::optional<Address> from_hex(std::string_view hex);

// Lowercase "0x..." rendering
std::string to_hex(const Address& addr);

// Helper for tests and tooling: address whose last two bytes encode n
constexpr Address from_index(uint16_t n) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((n >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(n & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

} // namespace addresses

// =============================================================================
// Wide Arithmetic
// =============================================================================

using U128 = unsigned __int128;

namespace u128 {

std::string to_string(U128 v);

// Checked 64-bit accumulate, false on wrap
inline bool add(uint64_t a, uint64_t b, uint64_t& out) {
    return !__builtin_add_overflow(a, b, &out);
}

inline bool sub(uint64_t a, uint64_t b, uint64_t& out) {
    return !__builtin_sub_overflow(a, b, &out);
}

} // namespace u128

// =============================================================================
// Protocol Constants
// =============================================================================

namespace limits {
constexpr uint64_t MAX_PRICE = 1000000000000ULL;     // 1e12 sanity ceiling
constexpr uint64_t MIN_RATIO_FLOOR = 110;             // percent
constexpr uint64_t MAX_FEE_RATE = 100;                // percent
constexpr uint64_t UNITS_PER_PERIOD = 144;            // time units per accrual period
constexpr uint64_t DEFAULT_INTEREST_RATE = 5;
constexpr uint64_t DEFAULT_MIN_RATIO = 150;
constexpr uint64_t DEFAULT_LIQUIDATION_THRESHOLD = 120;
constexpr uint64_t DEFAULT_FEE_RATE = 1;
constexpr size_t MAX_ACTIVE_POSITIONS = 10;
}

// =============================================================================
// Position
// =============================================================================

enum class PositionStatus : uint8_t {
    ACTIVE = 0,
    REPAID = 1,
    LIQUIDATED = 2
};

const char* to_string(PositionStatus status);

struct CLPosition {
    uint64_t id;
    Address borrower;
    uint64_t collateral_amount;
    uint64_t debt_amount;         // principal, never reduced
    uint64_t interest_rate;       // fixed at origination
    uint64_t opened_at;
    uint64_t last_accrual_at;
    PositionStatus status;

    bool is_active() const { return status == PositionStatus::ACTIVE; }
};

// =============================================================================
// Results
// =============================================================================

struct CLLoanResult {
    int32_t status;
    uint64_t loan_id;    // 0 unless status == OK
};

struct CLLiquidationCheck {
    int32_t status;
    bool liquidated;     // transition happened on this call
    U128 ratio;          // percent, valid when status == OK and position was active
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t UNAUTHORIZED = -1;
constexpr int32_t INSUFFICIENT_COLLATERAL = -2;
constexpr int32_t BELOW_MINIMUM = -3;
constexpr int32_t INVALID_AMOUNT = -4;
constexpr int32_t ALREADY_INITIALIZED = -5;
constexpr int32_t NOT_INITIALIZED = -6;
constexpr int32_t INVALID_LIQUIDATION = -7;
constexpr int32_t LOAN_NOT_FOUND = -8;
constexpr int32_t LOAN_NOT_ACTIVE = -9;
constexpr int32_t INVALID_LOAN_ID = -10;
constexpr int32_t INVALID_PRICE = -11;
constexpr int32_t INVALID_ASSET = -12;
constexpr int32_t ARITHMETIC_OVERFLOW = -20;

const char* to_string(int32_t code);
}

} // namespace colend

#endif // COLEND_TYPES_HPP
