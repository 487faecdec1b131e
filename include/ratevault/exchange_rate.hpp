// Ratevault - Exchange Rate Engine
// Replicates the market's accrual step without mutating the market

#pragma once

#include <ratevault/market.hpp>
#include <ratevault/types.hpp>

namespace ratevault {

// Market's own ceiling on the per-second borrow rate (0.0005e16)
Wad max_borrow_rate();

// Reads the accrual state of `market`
MarketSnapshot snapshot_of(const Market& market);

// Runs one accrual step from snapshot.accrual_timestamp to `now`.
//
// At now == accrual_timestamp nothing is simulated: totals are returned as
// stored and the exchange rate is snapshot.stored_exchange_rate, without
// consulting the rate model.
//
// Throws RateTooHigh when the model returns more than max_borrow_rate(),
// ArithmeticOverflow / DivisionByZero from the fixed-point operations,
// ArithmeticUnderflow when reserves exceed cash plus borrows, and
// std::invalid_argument when `now` precedes the accrual timestamp.
AccrualResult simulate_accrual(const MarketSnapshot& snapshot, Timestamp now,
                               const InterestRateModel& model);

// Exchange rate the market would store if it accrued at `now`
Wad compute_exchange_rate(const MarketSnapshot& snapshot, Timestamp now,
                          const InterestRateModel& model);

// compute_exchange_rate over the market's live state and rate model
Wad current_exchange_rate(const Market& market, Timestamp now);

}  // namespace ratevault
