#ifndef COLEND_ORACLE_HPP
#define COLEND_ORACLE_HPP

#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>

#include "types.hpp"

namespace colend {

// =============================================================================
// CLOracle - Single-Source Price Store
//
// One authoritative quote per recognized asset. Last write wins, no history,
// no staleness window. Only the administrator may publish.
// =============================================================================

class CLOracle {
public:
    CLOracle(const Address& admin, std::string collateral_asset, std::string secondary_asset);
    ~CLOracle() = default;

    CLOracle(const CLOracle&) = delete;
    CLOracle& operator=(const CLOracle&) = delete;

    // =========================================================================
    // Price Updates
    // =========================================================================

    // Validates without writing. Same codes as set_price.
    int32_t check_update(const Address& caller, std::string_view asset, uint64_t price) const;

    int32_t set_price(const Address& caller, std::string_view asset, uint64_t price);

    // =========================================================================
    // Price Queries
    // =========================================================================

    std::optional<uint64_t> get_price(std::string_view asset) const;
    std::optional<uint64_t> collateral_price() const { return get_price(collateral_asset_); }

    bool is_recognized(std::string_view asset) const;

    const std::string& collateral_asset() const { return collateral_asset_; }
    const std::string& secondary_asset() const { return secondary_asset_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t priced_assets;
        uint64_t total_updates;
    };
    Stats get_stats() const;

private:
    Address admin_;
    std::string collateral_asset_;
    std::string secondary_asset_;

    // asset symbol -> latest price
    std::unordered_map<std::string, uint64_t> prices_;

    uint64_t total_updates_{0};
};

} // namespace colend

#endif // COLEND_ORACLE_HPP
