// Ratevault - Market Registry and Vault Factory Implementation

#include <ratevault/registry.hpp>
#include <ratevault/errors.hpp>
#include <ratevault/log.hpp>

#include <stdexcept>
#include <utility>

namespace ratevault {

// =============================================================================
// MarketRegistry
// =============================================================================

void MarketRegistry::register_market(const Address& asset, std::shared_ptr<Market> market) {
    if (!market) {
        throw std::invalid_argument("Null market for asset " + addresses::to_hex(asset));
    }
    log::info("Registered market " + addresses::to_hex(market->address()) +
              " for asset " + addresses::to_hex(asset));
    markets_[asset] = std::move(market);
}

std::shared_ptr<Market> MarketRegistry::resolve(const Address& asset) const {
    auto it = markets_.find(asset);
    if (it == markets_.end()) {
        throw MarketUnresolved(asset);
    }
    return it->second;
}

bool MarketRegistry::contains(const Address& asset) const {
    return markets_.find(asset) != markets_.end();
}

// =============================================================================
// VaultFactory
// =============================================================================

VaultFactory::VaultFactory(const Address& factory_address, const MarketRegistry& registry,
                           const Clock& clock, const Address& reward_recipient)
    : factory_address_(factory_address),
      registry_(registry),
      clock_(clock),
      reward_recipient_(reward_recipient) {}

Address VaultFactory::compute_vault_address(const Address& asset) const {
    // FNV-1a over (factory || asset), re-seeded per 8-byte lane
    constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
    constexpr uint64_t FNV_PRIME = 1099511628211ULL;

    Address out = {};
    for (size_t lane = 0; lane < 3; ++lane) {
        uint64_t h = FNV_OFFSET ^ lane;
        for (auto b : factory_address_) h = (h ^ b) * FNV_PRIME;
        for (auto b : asset) h = (h ^ b) * FNV_PRIME;

        for (size_t i = 0; i < 8 && lane * 8 + i < out.size(); ++i) {
            out[lane * 8 + i] = static_cast<uint8_t>(h >> (56 - 8 * i));
        }
    }
    return out;
}

Vault& VaultFactory::create_vault(Token& asset) {
    const Address& asset_address = asset.address();

    if (vaults_.find(asset_address) != vaults_.end()) {
        throw VaultAlreadyExists(asset_address);
    }

    std::shared_ptr<Market> market = registry_.resolve(asset_address);
    Address vault_address = compute_vault_address(asset_address);

    auto vault = std::make_unique<Vault>(vault_address, asset, std::move(market),
                                         clock_, reward_recipient_);
    Vault& ref = *vault;
    vaults_.emplace(asset_address, std::move(vault));

    log::info("Created vault " + addresses::to_hex(vault_address) +
              " for asset " + addresses::to_hex(asset_address));
    return ref;
}

Vault* VaultFactory::vault_for(const Address& asset) const {
    auto it = vaults_.find(asset);
    return (it != vaults_.end()) ? it->second.get() : nullptr;
}

}  // namespace ratevault
