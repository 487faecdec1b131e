// Ratevault - Simulated Environment
// Tokens, markets, registry and vaults assembled from a Config

#pragma once

#include <ratevault/clock.hpp>
#include <ratevault/config.hpp>
#include <ratevault/registry.hpp>
#include <ratevault/simulated_market.hpp>
#include <ratevault/token.hpp>

#include <memory>
#include <unordered_map>

namespace ratevault {

// Owns every collaborator a configured set of vaults needs. Market state
// (cash, borrows, reserves, principal supply) is seeded from MarketConfig.
class Environment {
public:
    // Throws ConfigError on inconsistent market state
    Environment(const Config& config, const Clock& clock);

    // Non-copyable
    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    [[nodiscard]] MarketRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] VaultFactory& factory() noexcept { return *factory_; }

    // Throws MarketUnresolved for unknown assets
    [[nodiscard]] TokenLedger& token(const Address& asset) const;
    [[nodiscard]] SimulatedMarket& market(const Address& asset) const;
    [[nodiscard]] Vault& vault(const Address& asset) const;

private:
    std::unordered_map<Address, std::unique_ptr<TokenLedger>, AddressHash> tokens_;
    std::unordered_map<Address, std::shared_ptr<SimulatedMarket>, AddressHash> markets_;
    MarketRegistry registry_;
    std::unique_ptr<VaultFactory> factory_;
};

}  // namespace ratevault
