// Ratevault - Simulated Money Market
// Deterministic in-memory market that accrues interest on its own state

#pragma once

#include <ratevault/clock.hpp>
#include <ratevault/market.hpp>
#include <ratevault/token.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>

namespace ratevault {

class SimulatedMarket final : public Market {
public:
    SimulatedMarket(const Address& address, Token& underlying, const Clock& clock,
                    std::shared_ptr<const InterestRateModel> model,
                    const Wad& initial_exchange_rate, const Wad& reserve_factor);

    // Non-copyable
    SimulatedMarket(const SimulatedMarket&) = delete;
    SimulatedMarket& operator=(const SimulatedMarket&) = delete;

    // =========================================================================
    // Market interface
    // =========================================================================

    [[nodiscard]] const Address& address() const override { return address_; }
    [[nodiscard]] const Address& underlying() const override { return underlying_.address(); }

    [[nodiscard]] Timestamp accrual_timestamp() const override { return accrual_timestamp_; }
    [[nodiscard]] Wad stored_exchange_rate() const override;
    [[nodiscard]] Wad cash() const override;
    [[nodiscard]] Wad total_borrows() const override { return total_borrows_; }
    [[nodiscard]] Wad total_reserves() const override { return total_reserves_; }
    [[nodiscard]] Wad total_supply() const override { return total_supply_; }
    [[nodiscard]] Wad reserve_factor() const override { return reserve_factor_; }
    [[nodiscard]] Wad initial_exchange_rate() const override { return initial_exchange_rate_; }
    [[nodiscard]] const InterestRateModel& interest_rate_model() const override { return *model_; }

    [[nodiscard]] bool mint_paused() const override { return mint_paused_; }

    [[nodiscard]] Wad balance_of(const Address& account) const override;

    uint64_t mint(const Address& minter, const Wad& amount) override;
    uint64_t redeem_underlying(const Address& redeemer, const Wad& amount) override;

    // =========================================================================
    // Market-side operations
    // =========================================================================

    // Brings borrows, reserves and the borrow index up to clock.now()
    uint64_t accrue_interest();

    // Accrues, then returns the stored rate
    Wad exchange_rate_current();

    [[nodiscard]] Wad borrow_index() const noexcept { return borrow_index_; }

    // Lends cash out to `borrower`; lowers cash, raises borrows
    uint64_t borrow(const Address& borrower, const Wad& amount);

    // Pulls `amount` underlying from `payer` (allowance required)
    uint64_t repay_borrow(const Address& payer, const Wad& amount);

    // =========================================================================
    // Administration
    // =========================================================================

    void set_mint_paused(bool paused) { mint_paused_ = paused; }
    void set_reserve_factor(const Wad& factor) { reserve_factor_ = factor; }
    void set_interest_rate_model(std::shared_ptr<const InterestRateModel> model);

    // Overwrites accounting state as of `accrual_timestamp`. Cash is whatever
    // underlying the market holds.
    void load_state(Timestamp accrual_timestamp, const Wad& total_borrows,
                    const Wad& total_reserves);

    // Credits principal tokens without moving underlying (fixtures)
    void credit_principal(const Address& holder, const Wad& principal);

    // =========================================================================
    // Fault injection (tests)
    // =========================================================================

    // Next mint/redeem returns `code` without touching state
    void fail_next_mint(uint64_t code) { next_mint_failure_ = code; }
    void fail_next_redeem(uint64_t code) { next_redeem_failure_ = code; }

    // Called from inside mint/redeem before any state changes, the way a
    // token hook would hand control to an arbitrary contract
    using ReentryHook = std::function<void()>;
    void set_reentry_hook(ReentryHook hook) { reentry_hook_ = std::move(hook); }

    // Underlying paid out per redeem falls short by `skim` (tests)
    void set_skim(const Wad& skim) { skim_ = skim; }

private:
    void run_reentry_hook();

    Address address_;
    Token& underlying_;
    const Clock& clock_;
    std::shared_ptr<const InterestRateModel> model_;

    Wad initial_exchange_rate_;
    Wad reserve_factor_;

    Timestamp accrual_timestamp_;
    Wad total_borrows_;
    Wad total_reserves_;
    Wad borrow_index_;
    Wad total_supply_;
    std::unordered_map<Address, Wad, AddressHash> principal_;

    bool mint_paused_ = false;
    std::optional<uint64_t> next_mint_failure_;
    std::optional<uint64_t> next_redeem_failure_;
    ReentryHook reentry_hook_;
    Wad skim_;
};

}  // namespace ratevault
