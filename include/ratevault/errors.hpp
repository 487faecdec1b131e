// Ratevault - Error Types
// Every failure aborts the enclosing operation and surfaces to the caller

#pragma once

#include <ratevault/types.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ratevault {

// Base class for all ratevault failures
class VaultError : public std::runtime_error {
public:
    explicit VaultError(const std::string& msg) : std::runtime_error(msg) {}
};

// Fixed-point domain violations
class ArithmeticOverflow : public VaultError {
public:
    explicit ArithmeticOverflow(const std::string& op)
        : VaultError("Arithmetic overflow in " + op) {}
};

class ArithmeticUnderflow : public VaultError {
public:
    explicit ArithmeticUnderflow(const std::string& op)
        : VaultError("Arithmetic underflow in " + op) {}
};

class DivisionByZero : public VaultError {
public:
    explicit DivisionByZero(const std::string& op)
        : VaultError("Division by zero in " + op) {}
};

// Rate model returned a borrow rate above the market's own ceiling
class RateTooHigh : public VaultError {
public:
    explicit RateTooHigh(const Wad& rate)
        : VaultError("Borrow rate " + rate.str() + " exceeds maximum"), rate_(rate) {}

    [[nodiscard]] const Wad& rate() const noexcept { return rate_; }

private:
    Wad rate_;
};

// Market mint/redeem returned a non-zero status code
class MarketOperationFailed : public VaultError {
public:
    MarketOperationFailed(const std::string& op, uint64_t code)
        : VaultError("Market " + op + " failed with code " + std::to_string(code)),
          code_(code) {}

    [[nodiscard]] uint64_t code() const noexcept { return code_; }

private:
    uint64_t code_;
};

// Market moved a different underlying amount than the vault expected
class MarketBalanceMismatch : public VaultError {
public:
    MarketBalanceMismatch(const std::string& op, const Wad& expected, const Wad& actual)
        : VaultError("Market " + op + " moved " + actual.str() +
                     " underlying, expected " + expected.str()) {}
};

class MarketUnresolved : public VaultError {
public:
    explicit MarketUnresolved(const Address& asset)
        : VaultError("No market registered for asset " + addresses::to_hex(asset)) {}
};

class VaultAlreadyExists : public VaultError {
public:
    explicit VaultAlreadyExists(const Address& asset)
        : VaultError("Vault already exists for asset " + addresses::to_hex(asset)) {}
};

// Requested amount above max_deposit/max_mint/max_withdraw/max_redeem
class LimitExceeded : public VaultError {
public:
    LimitExceeded(const std::string& op, const Wad& requested, const Wad& limit)
        : VaultError(op + " of " + requested.str() + " exceeds max " + limit.str()) {}
};

class ZeroAmount : public VaultError {
public:
    explicit ZeroAmount(const std::string& what)
        : VaultError("Zero " + what) {}
};

class Reentrancy : public VaultError {
public:
    Reentrancy() : VaultError("Reentrant call") {}
};

// Token ledger failures
class InsufficientBalance : public VaultError {
public:
    InsufficientBalance(const Address& account, const Wad& balance, const Wad& needed)
        : VaultError("Insufficient balance for " + addresses::to_hex(account) + ": " +
                     balance.str() + " < " + needed.str()) {}
};

class InsufficientAllowance : public VaultError {
public:
    InsufficientAllowance(const Address& owner, const Wad& allowance, const Wad& needed)
        : VaultError("Insufficient allowance from " + addresses::to_hex(owner) + ": " +
                     allowance.str() + " < " + needed.str()) {}
};

// Configuration loading failure
class ConfigError : public VaultError {
public:
    explicit ConfigError(const std::string& msg) : VaultError(msg) {}
};

}  // namespace ratevault
