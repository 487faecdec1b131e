// Ratevault - Exchange Rate Engine Implementation

#include <ratevault/exchange_rate.hpp>
#include <ratevault/errors.hpp>
#include <ratevault/wad.hpp>

#include <stdexcept>
#include <string>

namespace ratevault {

Wad max_borrow_rate() {
    return Wad(5000000000000ULL);  // 0.0005e16
}

MarketSnapshot snapshot_of(const Market& market) {
    MarketSnapshot snapshot;
    snapshot.accrual_timestamp = market.accrual_timestamp();
    snapshot.stored_exchange_rate = market.stored_exchange_rate();
    snapshot.cash = market.cash();
    snapshot.total_borrows = market.total_borrows();
    snapshot.total_reserves = market.total_reserves();
    snapshot.total_supply = market.total_supply();
    snapshot.reserve_factor = market.reserve_factor();
    snapshot.initial_exchange_rate = market.initial_exchange_rate();
    return snapshot;
}

// =============================================================================
// Accrual Simulation
// =============================================================================

AccrualResult simulate_accrual(const MarketSnapshot& snapshot, Timestamp now,
                               const InterestRateModel& model) {
    AccrualResult result;

    // Market is already current
    if (now == snapshot.accrual_timestamp) {
        result.interest_accumulated = 0;
        result.total_borrows = snapshot.total_borrows;
        result.total_reserves = snapshot.total_reserves;
        result.exchange_rate = snapshot.stored_exchange_rate;
        return result;
    }

    if (now < snapshot.accrual_timestamp) {
        throw std::invalid_argument(
            "Timestamp " + std::to_string(now) + " precedes accrual timestamp " +
            std::to_string(snapshot.accrual_timestamp));
    }

    Timestamp elapsed = now - snapshot.accrual_timestamp;

    Wad borrow_rate = model.borrow_rate(
        snapshot.cash, snapshot.total_borrows, snapshot.total_reserves);
    if (borrow_rate > max_borrow_rate()) {
        throw RateTooHigh(borrow_rate);
    }

    Wad interest_factor = wad::checked_mul(borrow_rate, Wad(elapsed));
    result.interest_accumulated = wad::mul_wad_down(interest_factor, snapshot.total_borrows);

    result.total_reserves = wad::checked_add(
        wad::mul_wad_down(snapshot.reserve_factor, result.interest_accumulated),
        snapshot.total_reserves);
    result.total_borrows = wad::checked_add(
        result.interest_accumulated, snapshot.total_borrows);

    if (snapshot.total_supply == 0) {
        result.exchange_rate = snapshot.initial_exchange_rate;
        return result;
    }

    // Fails fast instead of wrapping when reserves exceed cash + borrows
    Wad underlying = wad::checked_sub(
        wad::checked_add(snapshot.cash, result.total_borrows), result.total_reserves);

    result.exchange_rate = wad::div_wad_down(underlying, snapshot.total_supply);
    return result;
}

Wad compute_exchange_rate(const MarketSnapshot& snapshot, Timestamp now,
                          const InterestRateModel& model) {
    return simulate_accrual(snapshot, now, model).exchange_rate;
}

Wad current_exchange_rate(const Market& market, Timestamp now) {
    return compute_exchange_rate(snapshot_of(market), now, market.interest_rate_model());
}

}  // namespace ratevault
