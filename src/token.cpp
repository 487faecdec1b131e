// Ratevault - Token Ledger Implementation

#include <ratevault/token.hpp>
#include <ratevault/errors.hpp>
#include <ratevault/wad.hpp>

#include <utility>

namespace ratevault {

TokenLedger::TokenLedger(const Address& address, std::string symbol)
    : address_(address), symbol_(std::move(symbol)) {}

Wad TokenLedger::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return (it != balances_.end()) ? it->second : Wad(0);
}

Wad TokenLedger::allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find(owner);
    if (it == allowances_.end()) return 0;
    auto jt = it->second.find(spender);
    return (jt != it->second.end()) ? jt->second : Wad(0);
}

void TokenLedger::transfer(const Address& from, const Address& to, const Wad& amount) {
    move(from, to, amount);
}

void TokenLedger::transfer_from(const Address& spender, const Address& from,
                                const Address& to, const Wad& amount) {
    Wad allowed = allowance(from, spender);
    if (allowed < amount) {
        throw InsufficientAllowance(from, allowed, amount);
    }

    move(from, to, amount);

    if (allowed != MAX_WAD) {
        allowances_[from][spender] = allowed - amount;
    }
}

void TokenLedger::approve(const Address& owner, const Address& spender, const Wad& amount) {
    allowances_[owner][spender] = amount;
}

void TokenLedger::mint(const Address& to, const Wad& amount) {
    total_supply_ = wad::checked_add(total_supply_, amount);
    balances_[to] += amount;
}

void TokenLedger::burn(const Address& from, const Wad& amount) {
    Wad balance = balance_of(from);
    if (balance < amount) {
        throw InsufficientBalance(from, balance, amount);
    }
    balances_[from] = balance - amount;
    total_supply_ -= amount;
}

void TokenLedger::move(const Address& from, const Address& to, const Wad& amount) {
    Wad balance = balance_of(from);
    if (balance < amount) {
        throw InsufficientBalance(from, balance, amount);
    }
    // Self-transfer leaves the balance unchanged
    balances_[from] = balance - amount;
    balances_[to] += amount;
}

}  // namespace ratevault
