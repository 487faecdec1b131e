// Ratevault - Configuration Implementation

#include <ratevault/config.hpp>
#include <ratevault/errors.hpp>
#include <ratevault/log.hpp>
#include <ratevault/wad.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ratevault {

using json = nlohmann::json;

namespace {

const json* find_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    return (it != obj.end() && !it->is_null()) ? &*it : nullptr;
}

std::string require_string(const json& obj, const char* key, const std::string& where) {
    const json* field = find_field(obj, key);
    if (!field) {
        throw ConfigError(where + ": missing '" + key + "'");
    }
    if (!field->is_string()) {
        throw ConfigError(where + ": '" + key + "' must be a string");
    }
    return field->get<std::string>();
}

Address read_address(const json& obj, const char* key, const std::string& where) {
    std::string hex = require_string(obj, key, where);
    try {
        return addresses::from_hex(hex);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(where + ": '" + key + "': " + e.what());
    }
}

// Token units as a decimal string ("1000.5"); absent means zero
Wad read_amount(const json& obj, const char* key, const std::string& where) {
    const json* field = find_field(obj, key);
    if (!field) return 0;
    if (!field->is_string()) {
        throw ConfigError(where + ": '" + key + "' must be a decimal string");
    }
    try {
        return wad::parse_units(field->get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(where + ": '" + key + "': " + e.what());
    } catch (const ArithmeticOverflow& e) {
        throw ConfigError(where + ": '" + key + "': " + e.what());
    }
}

MarketConfig read_market(const json& obj, size_t index) {
    std::string where = "markets[" + std::to_string(index) + "]";
    if (!obj.is_object()) {
        throw ConfigError(where + ": must be an object");
    }

    MarketConfig market;
    if (const json* name = find_field(obj, "name"); name && name->is_string()) {
        market.name = name->get<std::string>();
    }
    market.asset = read_address(obj, "asset", where);
    market.address = read_address(obj, "address", where);

    if (const json* ts = find_field(obj, "accrual_timestamp")) {
        if (!ts->is_number_unsigned()) {
            throw ConfigError(where + ": 'accrual_timestamp' must be an unsigned integer");
        }
        market.accrual_timestamp = ts->get<Timestamp>();
    }

    market.cash = read_amount(obj, "cash", where);
    market.total_borrows = read_amount(obj, "total_borrows", where);
    market.total_reserves = read_amount(obj, "total_reserves", where);
    market.total_supply = read_amount(obj, "total_supply", where);
    market.reserve_factor = read_amount(obj, "reserve_factor", where);
    market.initial_exchange_rate = read_amount(obj, "initial_exchange_rate", where);
    market.borrow_rate = read_amount(obj, "borrow_rate", where);

    if (const json* paused = find_field(obj, "mint_paused")) {
        if (!paused->is_boolean()) {
            throw ConfigError(where + ": 'mint_paused' must be a boolean");
        }
        market.mint_paused = paused->get<bool>();
    }

    if (market.initial_exchange_rate == 0) {
        throw ConfigError(where + ": 'initial_exchange_rate' must be positive");
    }
    if (market.reserve_factor > WAD) {
        throw ConfigError(where + ": 'reserve_factor' must not exceed 1");
    }
    return market;
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Config root must be an object");
    }

    Config config;

    if (const json* general = find_field(root, "general")) {
        if (const json* level = find_field(*general, "log_level")) {
            if (!level->is_string()) {
                throw ConfigError("general: 'log_level' must be a string");
            }
            config.general.log_level = level->get<std::string>();
        }
    }

    if (find_field(root, "factory")) {
        config.factory = read_address(root, "factory", "config");
    }
    if (find_field(root, "reward_recipient")) {
        config.reward_recipient = read_address(root, "reward_recipient", "config");
    }

    if (const json* markets = find_field(root, "markets")) {
        if (!markets->is_array()) {
            throw ConfigError("'markets' must be an array");
        }
        for (size_t i = 0; i < markets->size(); ++i) {
            config.markets.push_back(read_market((*markets)[i], i));
        }
    }

    if (const json* vaults = find_field(root, "vaults")) {
        if (!vaults->is_array()) {
            throw ConfigError("'vaults' must be an array");
        }
        for (size_t i = 0; i < vaults->size(); ++i) {
            std::string where = "vaults[" + std::to_string(i) + "]";
            const json& entry = (*vaults)[i];
            if (!entry.is_object()) {
                throw ConfigError(where + ": must be an object");
            }
            Address asset = read_address(entry, "asset", where);
            if (!config.market_for(asset)) {
                throw ConfigError(where + ": no market configured for asset " +
                                  addresses::to_hex(asset));
            }
            config.with_vault(asset);
        }
    }

    return config;
}

std::optional<MarketConfig> Config::market_for(const Address& asset) const {
    for (const auto& market : markets) {
        if (market.asset == asset) return market;
    }
    return std::nullopt;
}

void Config::apply_logging() const {
    try {
        log::set_level(log::level_from_string(general.log_level));
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

}  // namespace ratevault
