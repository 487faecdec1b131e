// Ratevault - Simulated Environment Implementation

#include <ratevault/environment.hpp>
#include <ratevault/errors.hpp>
#include <ratevault/log.hpp>
#include <ratevault/wad.hpp>

#include <utility>

namespace ratevault {

Environment::Environment(const Config& config, const Clock& clock) {
    for (const auto& cfg : config.markets) {
        Wad underlying;
        try {
            underlying = wad::checked_add(cfg.cash, cfg.total_borrows);
        } catch (const ArithmeticOverflow&) {
            throw ConfigError("Market " + cfg.name + ": cash plus borrows overflows");
        }
        if (underlying < cfg.total_reserves) {
            throw ConfigError("Market " + cfg.name + ": reserves exceed cash plus borrows");
        }
        if (tokens_.find(cfg.asset) != tokens_.end()) {
            throw ConfigError("Market " + cfg.name + ": asset " +
                              addresses::to_hex(cfg.asset) + " configured twice");
        }

        auto token = std::make_unique<TokenLedger>(cfg.asset, cfg.name);
        token->mint(cfg.address, cfg.cash);

        auto market = std::make_shared<SimulatedMarket>(
            cfg.address, *token, clock,
            std::make_shared<ConstantRateModel>(cfg.borrow_rate),
            cfg.initial_exchange_rate, cfg.reserve_factor);
        market->load_state(cfg.accrual_timestamp, cfg.total_borrows, cfg.total_reserves);
        if (cfg.total_supply > 0) {
            // Supply outstanding before the vault existed
            market->credit_principal(addresses::ZERO, cfg.total_supply);
        }
        market->set_mint_paused(cfg.mint_paused);

        registry_.register_market(cfg.asset, market);
        markets_.emplace(cfg.asset, std::move(market));
        tokens_.emplace(cfg.asset, std::move(token));

        log::debug("Seeded market " + cfg.name + " cash " + wad::to_string(cfg.cash) +
                   " borrows " + wad::to_string(cfg.total_borrows) +
                   " reserves " + wad::to_string(cfg.total_reserves));
    }

    factory_ = std::make_unique<VaultFactory>(config.factory, registry_, clock,
                                              config.reward_recipient);
    for (const auto& vault : config.vaults) {
        factory_->create_vault(token(vault.asset));
    }
}

TokenLedger& Environment::token(const Address& asset) const {
    auto it = tokens_.find(asset);
    if (it == tokens_.end()) {
        throw MarketUnresolved(asset);
    }
    return *it->second;
}

SimulatedMarket& Environment::market(const Address& asset) const {
    auto it = markets_.find(asset);
    if (it == markets_.end()) {
        throw MarketUnresolved(asset);
    }
    return *it->second;
}

Vault& Environment::vault(const Address& asset) const {
    Vault* v = factory_->vault_for(asset);
    if (!v) {
        throw MarketUnresolved(asset);
    }
    return *v;
}

}  // namespace ratevault
