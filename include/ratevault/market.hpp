// Ratevault - Money Market Interface
// Capability interface over the external lending market and its rate model

#pragma once

#include <ratevault/types.hpp>

#include <cstdint>

namespace ratevault {

// =============================================================================
// Market Status Codes
// =============================================================================

// Returned by mint/redeem_underlying; non-zero means the market rejected the call
namespace status {
constexpr uint64_t OK = 0;
constexpr uint64_t UNAUTHORIZED = 1;
constexpr uint64_t BAD_INPUT = 2;
constexpr uint64_t COMPTROLLER_REJECTION = 3;
constexpr uint64_t INTEREST_RATE_MODEL_ERROR = 5;
constexpr uint64_t MATH_ERROR = 9;
constexpr uint64_t MARKET_NOT_FRESH = 10;
constexpr uint64_t TOKEN_INSUFFICIENT_ALLOWANCE = 12;
constexpr uint64_t TOKEN_INSUFFICIENT_BALANCE = 13;
constexpr uint64_t TOKEN_INSUFFICIENT_CASH = 14;
}  // namespace status

// =============================================================================
// Interest Rate Model
// =============================================================================

// Opaque borrow-rate function, WAD per second
class InterestRateModel {
public:
    virtual ~InterestRateModel() = default;

    [[nodiscard]] virtual Wad borrow_rate(const Wad& cash, const Wad& borrows,
                                          const Wad& reserves) const = 0;
};

class ConstantRateModel final : public InterestRateModel {
public:
    explicit ConstantRateModel(const Wad& rate_per_second) : rate_(rate_per_second) {}

    [[nodiscard]] Wad borrow_rate(const Wad&, const Wad&, const Wad&) const override {
        return rate_;
    }

private:
    Wad rate_;
};

// =============================================================================
// Market
// =============================================================================

class Market {
public:
    virtual ~Market() = default;

    [[nodiscard]] virtual const Address& address() const = 0;
    [[nodiscard]] virtual const Address& underlying() const = 0;

    // Accrual state as of the last accrual
    [[nodiscard]] virtual Timestamp accrual_timestamp() const = 0;
    [[nodiscard]] virtual Wad stored_exchange_rate() const = 0;
    [[nodiscard]] virtual Wad cash() const = 0;
    [[nodiscard]] virtual Wad total_borrows() const = 0;
    [[nodiscard]] virtual Wad total_reserves() const = 0;
    [[nodiscard]] virtual Wad total_supply() const = 0;
    [[nodiscard]] virtual Wad reserve_factor() const = 0;
    [[nodiscard]] virtual Wad initial_exchange_rate() const = 0;
    [[nodiscard]] virtual const InterestRateModel& interest_rate_model() const = 0;

    [[nodiscard]] virtual bool mint_paused() const = 0;

    // Principal token balance
    [[nodiscard]] virtual Wad balance_of(const Address& account) const = 0;

    // Pulls `amount` underlying from `minter` (allowance required) and
    // credits principal tokens. Returns a status code.
    virtual uint64_t mint(const Address& minter, const Wad& amount) = 0;

    // Burns principal tokens worth `amount` underlying and sends the
    // underlying to `redeemer`. Returns a status code.
    virtual uint64_t redeem_underlying(const Address& redeemer, const Wad& amount) = 0;
};

}  // namespace ratevault
