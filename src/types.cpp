// =============================================================================
// types.cpp - Address, Wide Integer and Error Helpers
// =============================================================================

#include "colend/types.hpp"

#include <algorithm>

namespace colend {

namespace addresses {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace addresses

namespace u128 {

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace u128

const char* to_string(PositionStatus status) {
    switch (status) {
        case PositionStatus::ACTIVE: return "active";
        case PositionStatus::REPAID: return "repaid";
        case PositionStatus::LIQUIDATED: return "liquidated";
    }
    return "unknown";
}

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case UNAUTHORIZED: return "unauthorized";
        case INSUFFICIENT_COLLATERAL: return "insufficient_collateral";
        case BELOW_MINIMUM: return "below_minimum";
        case INVALID_AMOUNT: return "invalid_amount";
        case ALREADY_INITIALIZED: return "already_initialized";
        case NOT_INITIALIZED: return "not_initialized";
        case INVALID_LIQUIDATION: return "invalid_liquidation";
        case LOAN_NOT_FOUND: return "loan_not_found";
        case LOAN_NOT_ACTIVE: return "loan_not_active";
        case INVALID_LOAN_ID: return "invalid_loan_id";
        case INVALID_PRICE: return "invalid_price";
        case INVALID_ASSET: return "invalid_asset";
        case ARITHMETIC_OVERFLOW: return "arithmetic_overflow";
        default: return "unknown_error";
    }
}

} // namespace errors

} // namespace colend
