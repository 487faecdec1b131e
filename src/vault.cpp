// Ratevault - Market Vault Implementation

#include <ratevault/vault.hpp>
#include <ratevault/errors.hpp>
#include <ratevault/exchange_rate.hpp>
#include <ratevault/log.hpp>
#include <ratevault/wad.hpp>

#include <algorithm>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

namespace ratevault {

namespace {

// Undo log for one operation. run() replays recorded actions newest-first.
// Every action is attempted; the first failure is rethrown afterwards.
class Rollback {
public:
    Rollback() = default;
    Rollback(const Rollback&) = delete;
    Rollback& operator=(const Rollback&) = delete;

    void record(std::function<void()> undo) { undo_.push_back(std::move(undo)); }

    void run() {
        std::exception_ptr failure;
        for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
            try {
                (*it)();
            } catch (...) {
                if (!failure) failure = std::current_exception();
            }
        }
        undo_.clear();
        if (failure) std::rethrow_exception(failure);
    }

private:
    std::vector<std::function<void()>> undo_;
};

}  // namespace

// Holds the vault's entered flag for the duration of a mutating call
class Vault::ReentrancyGuard {
public:
    explicit ReentrancyGuard(bool& entered) : entered_(entered) {
        if (entered_) {
            throw Reentrancy();
        }
        entered_ = true;
    }

    ~ReentrancyGuard() { entered_ = false; }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    bool& entered_;
};

Vault::Vault(const Address& address, Token& asset, std::shared_ptr<Market> market,
             const Clock& clock, const Address& reward_recipient)
    : address_(address),
      asset_(asset),
      market_(std::move(market)),
      clock_(clock),
      reward_recipient_(reward_recipient),
      shares_(address, "rv-share") {}

// =============================================================================
// Valuation
// =============================================================================

Wad Vault::exchange_rate() const {
    return current_exchange_rate(*market_, clock_.now());
}

Wad Vault::total_assets() const {
    return wad::mul_wad_down(market_->balance_of(address_), exchange_rate());
}

Wad Vault::convert_to_shares(const Wad& assets) const {
    Wad supply = shares_.total_supply();
    return supply == 0 ? assets : wad::mul_div_down(assets, supply, total_assets());
}

Wad Vault::convert_to_assets(const Wad& shares) const {
    Wad supply = shares_.total_supply();
    return supply == 0 ? shares : wad::mul_div_down(shares, total_assets(), supply);
}

Wad Vault::preview_deposit(const Wad& assets) const {
    return convert_to_shares(assets);
}

Wad Vault::preview_mint(const Wad& shares) const {
    Wad supply = shares_.total_supply();
    return supply == 0 ? shares : wad::mul_div_up(shares, total_assets(), supply);
}

Wad Vault::preview_withdraw(const Wad& assets) const {
    Wad supply = shares_.total_supply();
    return supply == 0 ? assets : wad::mul_div_up(assets, supply, total_assets());
}

Wad Vault::preview_redeem(const Wad& shares) const {
    return convert_to_assets(shares);
}

// =============================================================================
// Limits
// =============================================================================

Wad Vault::max_deposit(const Address&) const {
    return market_->mint_paused() ? Wad(0) : MAX_WAD;
}

Wad Vault::max_mint(const Address&) const {
    return market_->mint_paused() ? Wad(0) : MAX_WAD;
}

Wad Vault::max_withdraw(const Address& owner) const {
    Wad cash = market_->cash();
    Wad entitled = convert_to_assets(shares_.balance_of(owner));
    return std::min(cash, entitled);
}

Wad Vault::max_redeem(const Address& owner) const {
    Wad cash_in_shares = convert_to_shares(market_->cash());
    Wad held = shares_.balance_of(owner);
    return std::min(cash_in_shares, held);
}

// =============================================================================
// Deposit / Withdraw
// =============================================================================

Wad Vault::deposit(const Address& caller, const Wad& assets, const Address& receiver) {
    ReentrancyGuard guard(entered_);

    Wad limit = max_deposit(receiver);
    if (assets > limit) {
        throw LimitExceeded("deposit", assets, limit);
    }

    Wad shares = preview_deposit(assets);
    if (shares == 0) {
        throw ZeroAmount("shares");
    }

    supply_market(caller, assets, shares, receiver);
    return shares;
}

Wad Vault::mint(const Address& caller, const Wad& shares, const Address& receiver) {
    ReentrancyGuard guard(entered_);

    Wad limit = max_mint(receiver);
    if (shares > limit) {
        throw LimitExceeded("mint", shares, limit);
    }
    if (shares == 0) {
        throw ZeroAmount("shares");
    }

    Wad assets = preview_mint(shares);
    if (assets == 0) {
        throw ZeroAmount("assets");
    }

    supply_market(caller, assets, shares, receiver);
    return assets;
}

Wad Vault::withdraw(const Address& caller, const Wad& assets, const Address& receiver,
                    const Address& owner) {
    ReentrancyGuard guard(entered_);

    Wad limit = max_withdraw(owner);
    if (assets > limit) {
        throw LimitExceeded("withdraw", assets, limit);
    }
    if (assets == 0) {
        throw ZeroAmount("assets");
    }

    Wad shares = preview_withdraw(assets);
    redeem_from_market(caller, assets, shares, receiver, owner);
    return shares;
}

Wad Vault::redeem(const Address& caller, const Wad& shares, const Address& receiver,
                  const Address& owner) {
    ReentrancyGuard guard(entered_);

    Wad limit = max_redeem(owner);
    if (shares > limit) {
        throw LimitExceeded("redeem", shares, limit);
    }

    Wad assets = preview_redeem(shares);
    if (assets == 0) {
        throw ZeroAmount("assets");
    }

    redeem_from_market(caller, assets, shares, receiver, owner);
    return assets;
}

void Vault::supply_market(const Address& caller, const Wad& assets, const Wad& shares,
                          const Address& receiver) {
    Rollback rollback;
    const Address& market_address = market_->address();

    try {
        asset_.transfer_from(address_, caller, address_, assets);
        rollback.record([this, caller, assets] { asset_.transfer(address_, caller, assets); });

        // Share bookkeeping is final before the market gets control
        shares_.mint(receiver, shares);
        rollback.record([this, receiver, shares] { shares_.burn(receiver, shares); });

        Wad prior_allowance = asset_.allowance(address_, market_address);
        asset_.approve(address_, market_address, assets);
        rollback.record([this, market_address, prior_allowance] {
            asset_.approve(address_, market_address, prior_allowance);
        });

        uint64_t code = market_->mint(address_, assets);
        if (code != status::OK) {
            log::warn("Market mint of " + wad::to_string(assets) + " failed with code " +
                      std::to_string(code) + ", rolling back deposit");
            throw MarketOperationFailed("mint", code);
        }
    } catch (...) {
        rollback.run();
        throw;
    }

    if (log::level() <= log::Level::Debug) {
        log::debug("Deposited " + wad::to_string(assets) + " for " + wad::to_string(shares) +
                   " shares to " + addresses::to_hex(receiver) +
                   ", total assets " + wad::to_string(total_assets()));
    }
}

void Vault::redeem_from_market(const Address& caller, const Wad& assets, const Wad& shares,
                               const Address& receiver, const Address& owner) {
    Rollback rollback;

    try {
        if (caller != owner) {
            Wad allowed = shares_.allowance(owner, caller);
            if (allowed < shares) {
                throw InsufficientAllowance(owner, allowed, shares);
            }
            if (allowed != MAX_WAD) {
                shares_.approve(owner, caller, allowed - shares);
                rollback.record([this, owner, caller, allowed] {
                    shares_.approve(owner, caller, allowed);
                });
            }
        }

        // Share bookkeeping is final before the market gets control
        shares_.burn(owner, shares);
        rollback.record([this, owner, shares] { shares_.mint(owner, shares); });

        Wad held = asset_.balance_of(address_);

        uint64_t code = market_->redeem_underlying(address_, assets);
        if (code != status::OK) {
            log::warn("Market redeem of " + wad::to_string(assets) + " failed with code " +
                      std::to_string(code) + ", rolling back withdrawal");
            throw MarketOperationFailed("redeem_underlying", code);
        }

        // Whatever the market paid goes back in if the withdrawal unwinds
        Wad now_held = asset_.balance_of(address_);
        Wad received = now_held > held ? now_held - held : Wad(0);
        rollback.record([this, received] { resupply_market(received); });

        // Re-validate after the market returns control
        if (received != assets) {
            log::warn("Market redeem paid " + wad::to_string(received) + ", expected " +
                      wad::to_string(assets) + ", rolling back withdrawal");
            throw MarketBalanceMismatch("redeem_underlying", assets, received);
        }

        asset_.transfer(address_, receiver, assets);
    } catch (...) {
        rollback.run();
        throw;
    }

    if (log::level() <= log::Level::Debug) {
        log::debug("Withdrew " + wad::to_string(assets) + " for " + wad::to_string(shares) +
                   " shares of " + addresses::to_hex(owner) +
                   ", total assets " + wad::to_string(total_assets()));
    }
}

void Vault::resupply_market(const Wad& assets) {
    if (assets == 0) return;

    const Address& market_address = market_->address();
    Wad prior_allowance = asset_.allowance(address_, market_address);
    asset_.approve(address_, market_address, assets);

    uint64_t code = market_->mint(address_, assets);
    asset_.approve(address_, market_address, prior_allowance);
    if (code != status::OK) {
        log::error("Market refused to take back " + wad::to_string(assets) +
                   " underlying with code " + std::to_string(code));
        throw MarketOperationFailed("mint", code);
    }
}

// =============================================================================
// Rewards
// =============================================================================

Wad Vault::claim_rewards(RewardsDistributor& distributor, Token& reward_token) {
    ReentrancyGuard guard(entered_);

    distributor.claim_rewards(address_);

    Wad amount = reward_token.balance_of(address_);
    if (amount > 0) {
        reward_token.transfer(address_, reward_recipient_, amount);
    }

    log::info("Forwarded " + wad::to_string(amount) + " rewards to " +
              addresses::to_hex(reward_recipient_));
    return amount;
}

// =============================================================================
// Share Token
// =============================================================================

void Vault::transfer(const Address& from, const Address& to, const Wad& shares) {
    ReentrancyGuard guard(entered_);
    shares_.transfer(from, to, shares);
}

void Vault::transfer_from(const Address& spender, const Address& from, const Address& to,
                          const Wad& shares) {
    ReentrancyGuard guard(entered_);
    shares_.transfer_from(spender, from, to, shares);
}

void Vault::approve(const Address& owner, const Address& spender, const Wad& shares) {
    shares_.approve(owner, spender, shares);
}

}  // namespace ratevault
