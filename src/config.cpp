// =============================================================================
// config.cpp - LedgerConfig JSON Loading
// =============================================================================

#include "colend/config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace colend {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (it->is_number_integer() && !it->is_number_unsigned()) {
            throw std::runtime_error(std::string("Invalid config field '") + key +
                                     "': must be non-negative");
        }
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config field '") + key + "': " + e.what());
    }
}

}  // namespace

LedgerConfig LedgerConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
}

LedgerConfig LedgerConfig::from_json_string(std::string_view content) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed config JSON: ") + e.what());
    }
    return from_json(j);
}

LedgerConfig LedgerConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    LedgerConfig config;

    std::string admin_hex;
    read_field(j, "admin", admin_hex);
    if (!admin_hex.empty()) {
        auto admin = addresses::from_hex(admin_hex);
        if (!admin) {
            throw std::runtime_error("Invalid admin address: " + admin_hex);
        }
        config.admin = *admin;
    }

    read_field(j, "collateral_asset", config.collateral_asset);
    read_field(j, "secondary_asset", config.secondary_asset);

    if (auto risk = j.find("risk"); risk != j.end() && risk->is_object()) {
        read_field(*risk, "minimum_collateral_ratio", config.minimum_collateral_ratio);
        read_field(*risk, "liquidation_threshold", config.liquidation_threshold);
        read_field(*risk, "fee_rate", config.fee_rate);
        read_field(*risk, "interest_rate", config.interest_rate);
        read_field(*risk, "min_debt_amount", config.min_debt_amount);
        read_field(*risk, "max_active_positions", config.max_active_positions);
    }

    if (auto policy = j.find("policy"); policy != j.end() && policy->is_object()) {
        read_field(*policy, "clear_index_on_liquidation", config.clear_index_on_liquidation);
        read_field(*policy, "legacy_deposit_accounting", config.legacy_deposit_accounting);
    }

    read_field(j, "log_level", config.log_level);

    config.validate();
    return config;
}

nlohmann::json LedgerConfig::to_json() const {
    return nlohmann::json{
        {"admin", addresses::to_hex(admin)},
        {"collateral_asset", collateral_asset},
        {"secondary_asset", secondary_asset},
        {"risk", {
            {"minimum_collateral_ratio", minimum_collateral_ratio},
            {"liquidation_threshold", liquidation_threshold},
            {"fee_rate", fee_rate},
            {"interest_rate", interest_rate},
            {"min_debt_amount", min_debt_amount},
            {"max_active_positions", max_active_positions},
        }},
        {"policy", {
            {"clear_index_on_liquidation", clear_index_on_liquidation},
            {"legacy_deposit_accounting", legacy_deposit_accounting},
        }},
        {"log_level", log_level},
    };
}

void LedgerConfig::validate() const {
    if (collateral_asset.empty() || secondary_asset.empty()) {
        throw std::runtime_error("Asset symbols must be non-empty");
    }
    if (collateral_asset == secondary_asset) {
        throw std::runtime_error("Collateral and secondary asset must differ");
    }
    if (minimum_collateral_ratio < limits::MIN_RATIO_FLOOR) {
        throw std::runtime_error("minimum_collateral_ratio must be >= 110");
    }
    if (liquidation_threshold < limits::MIN_RATIO_FLOOR) {
        throw std::runtime_error("liquidation_threshold must be >= 110");
    }
    if (fee_rate > limits::MAX_FEE_RATE) {
        throw std::runtime_error("fee_rate must be <= 100");
    }
    if (max_active_positions == 0 || max_active_positions > limits::MAX_ACTIVE_POSITIONS) {
        throw std::runtime_error("max_active_positions must be in 1..10");
    }
}

} // namespace colend
