// Ratevault - Market Registry and Vault Factory

#pragma once

#include <ratevault/clock.hpp>
#include <ratevault/market.hpp>
#include <ratevault/token.hpp>
#include <ratevault/types.hpp>
#include <ratevault/vault.hpp>

#include <memory>
#include <unordered_map>

namespace ratevault {

// Asset -> market lookup. Entries are inserted or overwritten, never removed.
class MarketRegistry {
public:
    void register_market(const Address& asset, std::shared_ptr<Market> market);

    // Throws MarketUnresolved
    [[nodiscard]] std::shared_ptr<Market> resolve(const Address& asset) const;

    [[nodiscard]] bool contains(const Address& asset) const;
    [[nodiscard]] size_t size() const noexcept { return markets_.size(); }

private:
    std::unordered_map<Address, std::shared_ptr<Market>, AddressHash> markets_;
};

// One vault per asset at an address derived from (factory, asset)
class VaultFactory {
public:
    VaultFactory(const Address& factory_address, const MarketRegistry& registry,
                 const Clock& clock, const Address& reward_recipient);

    // Non-copyable
    VaultFactory(const VaultFactory&) = delete;
    VaultFactory& operator=(const VaultFactory&) = delete;

    // Pure function of the factory address and `asset`
    [[nodiscard]] Address compute_vault_address(const Address& asset) const;

    // Throws MarketUnresolved, VaultAlreadyExists
    Vault& create_vault(Token& asset);

    // nullptr when no vault exists for `asset`
    [[nodiscard]] Vault* vault_for(const Address& asset) const;

    [[nodiscard]] size_t vault_count() const noexcept { return vaults_.size(); }

private:
    Address factory_address_;
    const MarketRegistry& registry_;
    const Clock& clock_;
    Address reward_recipient_;
    std::unordered_map<Address, std::unique_ptr<Vault>, AddressHash> vaults_;
};

}  // namespace ratevault
