// Ratevault - Market Vault
// ERC-4626 style share accounting over a money-market position

#pragma once

#include <ratevault/clock.hpp>
#include <ratevault/market.hpp>
#include <ratevault/rewards.hpp>
#include <ratevault/token.hpp>
#include <ratevault/types.hpp>

#include <memory>
#include <string>

namespace ratevault {

// Holds principal tokens of one market on behalf of share holders.
//
// Valuation goes through the exchange rate engine on every call and is never
// cached. Mutating entry points are all-or-nothing: a failure at any step,
// including a non-zero market status, reverts every effect already applied.
// Share bookkeeping is finalized before control passes to the market, and a
// nested mutating call made from inside the market fails with Reentrancy.
class Vault {
public:
    Vault(const Address& address, Token& asset, std::shared_ptr<Market> market,
          const Clock& clock, const Address& reward_recipient);

    // Non-copyable
    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    [[nodiscard]] const Address& address() const noexcept { return address_; }
    [[nodiscard]] const Address& asset() const { return asset_.address(); }
    [[nodiscard]] const Market& market() const noexcept { return *market_; }
    [[nodiscard]] const Address& reward_recipient() const noexcept { return reward_recipient_; }

    // =========================================================================
    // Valuation
    // =========================================================================

    // Exchange rate the market would store if it accrued now
    [[nodiscard]] Wad exchange_rate() const;

    // Underlying value of the vault's principal tokens
    [[nodiscard]] Wad total_assets() const;

    [[nodiscard]] Wad convert_to_shares(const Wad& assets) const;
    [[nodiscard]] Wad convert_to_assets(const Wad& shares) const;

    [[nodiscard]] Wad preview_deposit(const Wad& assets) const;
    [[nodiscard]] Wad preview_mint(const Wad& shares) const;
    [[nodiscard]] Wad preview_withdraw(const Wad& assets) const;
    [[nodiscard]] Wad preview_redeem(const Wad& shares) const;

    // =========================================================================
    // Limits
    // =========================================================================

    // Zero while the market has minting paused, otherwise unbounded
    [[nodiscard]] Wad max_deposit(const Address& receiver) const;
    [[nodiscard]] Wad max_mint(const Address& receiver) const;

    // Bounded by the owner's entitlement and the market's liquid cash
    [[nodiscard]] Wad max_withdraw(const Address& owner) const;
    [[nodiscard]] Wad max_redeem(const Address& owner) const;

    // =========================================================================
    // Deposit / Withdraw
    // =========================================================================

    // Returns shares minted to `receiver`
    Wad deposit(const Address& caller, const Wad& assets, const Address& receiver);

    // Returns assets pulled from `caller`
    Wad mint(const Address& caller, const Wad& shares, const Address& receiver);

    // Returns shares burned from `owner`
    Wad withdraw(const Address& caller, const Wad& assets, const Address& receiver,
                 const Address& owner);

    // Returns assets sent to `receiver`
    Wad redeem(const Address& caller, const Wad& shares, const Address& receiver,
               const Address& owner);

    // =========================================================================
    // Rewards
    // =========================================================================

    // Claims from `distributor` and forwards the vault's whole balance of
    // `reward_token` to the reward recipient. Returns the amount forwarded.
    Wad claim_rewards(RewardsDistributor& distributor, Token& reward_token);

    // =========================================================================
    // Share Token
    // =========================================================================

    [[nodiscard]] Wad total_supply() const { return shares_.total_supply(); }
    [[nodiscard]] Wad balance_of(const Address& account) const { return shares_.balance_of(account); }
    [[nodiscard]] Wad allowance(const Address& owner, const Address& spender) const {
        return shares_.allowance(owner, spender);
    }

    void transfer(const Address& from, const Address& to, const Wad& shares);
    void transfer_from(const Address& spender, const Address& from, const Address& to,
                       const Wad& shares);
    void approve(const Address& owner, const Address& spender, const Wad& shares);

private:
    class ReentrancyGuard;

    // Pulls `assets` from `caller`, mints `shares`, supplies the market
    void supply_market(const Address& caller, const Wad& assets, const Wad& shares,
                       const Address& receiver);

    // Burns `shares` of `owner`, redeems from the market, pays `receiver`
    void redeem_from_market(const Address& caller, const Wad& assets, const Wad& shares,
                            const Address& receiver, const Address& owner);

    // Supplies underlying the vault holds back to the market; throws
    // MarketOperationFailed when the market refuses it
    void resupply_market(const Wad& assets);

    Address address_;
    Token& asset_;
    std::shared_ptr<Market> market_;
    const Clock& clock_;
    const Address reward_recipient_;

    TokenLedger shares_;
    bool entered_ = false;
};

}  // namespace ratevault
