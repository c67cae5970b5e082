// =============================================================================
// oracle.cpp - CLOracle Single-Source Price Store
// =============================================================================

#include "colend/oracle.hpp"
#include "colend/logging.hpp"
#include <utility>

namespace colend {

CLOracle::CLOracle(const Address& admin, std::string collateral_asset, std::string secondary_asset)
    : admin_(admin),
      collateral_asset_(std::move(collateral_asset)),
      secondary_asset_(std::move(secondary_asset)) {}

// =============================================================================
// Price Updates
// =============================================================================

int32_t CLOracle::check_update(const Address& caller, std::string_view asset, uint64_t price) const {
    if (caller != admin_) {
        return errors::UNAUTHORIZED;
    }
    if (!is_recognized(asset)) {
        return errors::INVALID_ASSET;
    }
    if (price == 0 || price > limits::MAX_PRICE) {
        return errors::INVALID_PRICE;
    }
    return errors::OK;
}

int32_t CLOracle::set_price(const Address& caller, std::string_view asset, uint64_t price) {
    int32_t rc = check_update(caller, asset, price);
    if (rc != errors::OK) {
        log::get()->debug("set_price {} rejected: {}", asset, errors::to_string(rc));
        return rc;
    }

    prices_[std::string(asset)] = price;
    ++total_updates_;

    log::get()->info("price {} = {}", asset, price);
    return errors::OK;
}

// =============================================================================
// Price Queries
// =============================================================================

std::optional<uint64_t> CLOracle::get_price(std::string_view asset) const {
    auto it = prices_.find(std::string(asset));
    if (it == prices_.end()) return std::nullopt;
    return it->second;
}

bool CLOracle::is_recognized(std::string_view asset) const {
    return asset == collateral_asset_ || asset == secondary_asset_;
}

CLOracle::Stats CLOracle::get_stats() const {
    return Stats{
        static_cast<uint64_t>(prices_.size()),
        total_updates_
    };
}

} // namespace colend
