// Ratevault - Simulated Money Market Implementation

#include <ratevault/simulated_market.hpp>
#include <ratevault/errors.hpp>
#include <ratevault/exchange_rate.hpp>
#include <ratevault/wad.hpp>

#include <utility>

namespace ratevault {

SimulatedMarket::SimulatedMarket(const Address& address, Token& underlying, const Clock& clock,
                                 std::shared_ptr<const InterestRateModel> model,
                                 const Wad& initial_exchange_rate, const Wad& reserve_factor)
    : address_(address),
      underlying_(underlying),
      clock_(clock),
      model_(std::move(model)),
      initial_exchange_rate_(initial_exchange_rate),
      reserve_factor_(reserve_factor),
      accrual_timestamp_(clock.now()),
      borrow_index_(WAD) {}

// =============================================================================
// Views
// =============================================================================

Wad SimulatedMarket::cash() const {
    return underlying_.balance_of(address_);
}

Wad SimulatedMarket::stored_exchange_rate() const {
    if (total_supply_ == 0) {
        return initial_exchange_rate_;
    }
    // (cash + borrows - reserves) / supply
    Wad underlying = wad::checked_sub(wad::checked_add(cash(), total_borrows_), total_reserves_);
    return wad::div_wad_down(underlying, total_supply_);
}

Wad SimulatedMarket::balance_of(const Address& account) const {
    auto it = principal_.find(account);
    return (it != principal_.end()) ? it->second : Wad(0);
}

// =============================================================================
// Interest Accrual
// =============================================================================

uint64_t SimulatedMarket::accrue_interest() {
    Timestamp now = clock_.now();
    if (now == accrual_timestamp_) {
        return status::OK;
    }
    if (now < accrual_timestamp_) {
        return status::MATH_ERROR;
    }

    Wad borrow_rate = model_->borrow_rate(cash(), total_borrows_, total_reserves_);
    if (borrow_rate > max_borrow_rate()) {
        return status::INTEREST_RATE_MODEL_ERROR;
    }

    Wad simple_interest_factor = wad::checked_mul(borrow_rate, Wad(now - accrual_timestamp_));
    Wad interest = wad::mul_wad_down(simple_interest_factor, total_borrows_);

    total_borrows_ = wad::checked_add(interest, total_borrows_);
    total_reserves_ = wad::checked_add(wad::mul_wad_down(reserve_factor_, interest), total_reserves_);
    borrow_index_ = wad::checked_add(wad::mul_wad_down(simple_interest_factor, borrow_index_),
                                     borrow_index_);
    accrual_timestamp_ = now;

    return status::OK;
}

Wad SimulatedMarket::exchange_rate_current() {
    uint64_t err = accrue_interest();
    if (err != status::OK) {
        throw MarketOperationFailed("accrue_interest", err);
    }
    return stored_exchange_rate();
}

// =============================================================================
// Mint / Redeem
// =============================================================================

uint64_t SimulatedMarket::mint(const Address& minter, const Wad& amount) {
    run_reentry_hook();

    if (next_mint_failure_) {
        uint64_t code = *next_mint_failure_;
        next_mint_failure_.reset();
        return code;
    }

    uint64_t err = accrue_interest();
    if (err != status::OK) return err;

    if (mint_paused_) return status::COMPTROLLER_REJECTION;

    if (underlying_.allowance(minter, address_) < amount) {
        return status::TOKEN_INSUFFICIENT_ALLOWANCE;
    }
    if (underlying_.balance_of(minter) < amount) {
        return status::TOKEN_INSUFFICIENT_BALANCE;
    }

    Wad principal = wad::div_wad_down(amount, stored_exchange_rate());

    underlying_.transfer_from(address_, minter, address_, amount);

    total_supply_ = wad::checked_add(total_supply_, principal);
    principal_[minter] += principal;

    return status::OK;
}

uint64_t SimulatedMarket::redeem_underlying(const Address& redeemer, const Wad& amount) {
    run_reentry_hook();

    if (next_redeem_failure_) {
        uint64_t code = *next_redeem_failure_;
        next_redeem_failure_.reset();
        return code;
    }

    uint64_t err = accrue_interest();
    if (err != status::OK) return err;

    // Truncates, so the redeemer never burns more than the amount is worth
    Wad redeem_tokens = wad::div_wad_down(amount, stored_exchange_rate());

    Wad held = balance_of(redeemer);
    if (held < redeem_tokens) {
        return status::TOKEN_INSUFFICIENT_BALANCE;
    }
    if (cash() < amount) {
        return status::TOKEN_INSUFFICIENT_CASH;
    }

    principal_[redeemer] = held - redeem_tokens;
    total_supply_ -= redeem_tokens;

    Wad moved = amount > skim_ ? amount - skim_ : Wad(0);
    underlying_.transfer(address_, redeemer, moved);

    return status::OK;
}

// =============================================================================
// Borrowing
// =============================================================================

uint64_t SimulatedMarket::borrow(const Address& borrower, const Wad& amount) {
    uint64_t err = accrue_interest();
    if (err != status::OK) return err;

    if (cash() < amount) {
        return status::TOKEN_INSUFFICIENT_CASH;
    }

    total_borrows_ = wad::checked_add(total_borrows_, amount);
    underlying_.transfer(address_, borrower, amount);
    return status::OK;
}

uint64_t SimulatedMarket::repay_borrow(const Address& payer, const Wad& amount) {
    uint64_t err = accrue_interest();
    if (err != status::OK) return err;

    if (amount > total_borrows_) {
        return status::BAD_INPUT;
    }
    if (underlying_.allowance(payer, address_) < amount) {
        return status::TOKEN_INSUFFICIENT_ALLOWANCE;
    }
    if (underlying_.balance_of(payer) < amount) {
        return status::TOKEN_INSUFFICIENT_BALANCE;
    }

    underlying_.transfer_from(address_, payer, address_, amount);
    total_borrows_ -= amount;
    return status::OK;
}

// =============================================================================
// Administration
// =============================================================================

void SimulatedMarket::set_interest_rate_model(std::shared_ptr<const InterestRateModel> model) {
    // Interest up to now accrues under the old model
    uint64_t err = accrue_interest();
    if (err != status::OK) {
        throw MarketOperationFailed("accrue_interest", err);
    }
    model_ = std::move(model);
}

void SimulatedMarket::load_state(Timestamp accrual_timestamp, const Wad& total_borrows,
                                 const Wad& total_reserves) {
    accrual_timestamp_ = accrual_timestamp;
    total_borrows_ = total_borrows;
    total_reserves_ = total_reserves;
}

void SimulatedMarket::credit_principal(const Address& holder, const Wad& principal) {
    total_supply_ = wad::checked_add(total_supply_, principal);
    principal_[holder] += principal;
}

void SimulatedMarket::run_reentry_hook() {
    if (!reentry_hook_) return;
    // Hook fires once; clear before calling so a nested mint does not recurse
    ReentryHook hook = std::move(reentry_hook_);
    reentry_hook_ = nullptr;
    hook();
}

}  // namespace ratevault
