// Ratevault - Configuration
// Builder pattern plus JSON loading for markets and vaults

#pragma once

#include <ratevault/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ratevault {

// General settings
struct GeneralConfig {
    std::string log_level = "info";
};

// One money market and the accrual state it starts from
struct MarketConfig {
    std::string name;
    Address asset{};
    Address address{};
    Timestamp accrual_timestamp = 0;
    Wad cash;
    Wad total_borrows;
    Wad total_reserves;
    Wad total_supply;
    Wad reserve_factor;
    Wad initial_exchange_rate;
    Wad borrow_rate;            // per second, WAD
    bool mint_paused = false;
};

struct VaultConfig {
    Address asset{};
};

// Main configuration
class Config {
public:
    GeneralConfig general;
    Address factory{};
    Address reward_recipient{};
    std::vector<MarketConfig> markets;
    std::vector<VaultConfig> vaults;

    Config() = default;

    // Load from JSON file; throws ConfigError
    static Config from_file(std::string_view path);

    // Load from JSON text; throws ConfigError
    static Config from_json(std::string_view content);

    // Builder methods
    Config& with_market(MarketConfig market) {
        markets.push_back(std::move(market));
        return *this;
    }

    Config& with_vault(const Address& asset) {
        vaults.push_back(VaultConfig{asset});
        return *this;
    }

    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& set_reward_recipient(const Address& recipient) {
        reward_recipient = recipient;
        return *this;
    }

    [[nodiscard]] std::optional<MarketConfig> market_for(const Address& asset) const;

    // Applies general.log_level to the process log; throws ConfigError
    void apply_logging() const;
};

}  // namespace ratevault
