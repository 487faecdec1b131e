// Ratevault - Token Interface
// ERC-20 style balances and allowances with the acting address passed explicitly

#pragma once

#include <ratevault/types.hpp>

#include <string>
#include <unordered_map>

namespace ratevault {

class Token {
public:
    virtual ~Token() = default;

    [[nodiscard]] virtual const Address& address() const = 0;
    [[nodiscard]] virtual Wad total_supply() const = 0;
    [[nodiscard]] virtual Wad balance_of(const Address& account) const = 0;
    [[nodiscard]] virtual Wad allowance(const Address& owner, const Address& spender) const = 0;

    // Moves from `from`, which is also the caller
    virtual void transfer(const Address& from, const Address& to, const Wad& amount) = 0;

    // `spender` moves tokens out of `from` against its allowance
    virtual void transfer_from(const Address& spender, const Address& from,
                               const Address& to, const Wad& amount) = 0;

    virtual void approve(const Address& owner, const Address& spender, const Wad& amount) = 0;
};

// In-memory ledger. Also backs the vault's own share token.
// An allowance of MAX_WAD is treated as infinite and never decremented.
class TokenLedger final : public Token {
public:
    TokenLedger(const Address& address, std::string symbol);

    [[nodiscard]] const Address& address() const override { return address_; }
    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }

    [[nodiscard]] Wad total_supply() const override { return total_supply_; }
    [[nodiscard]] Wad balance_of(const Address& account) const override;
    [[nodiscard]] Wad allowance(const Address& owner, const Address& spender) const override;

    void transfer(const Address& from, const Address& to, const Wad& amount) override;
    void transfer_from(const Address& spender, const Address& from,
                       const Address& to, const Wad& amount) override;
    void approve(const Address& owner, const Address& spender, const Wad& amount) override;

    // Issuance, not part of the Token interface
    void mint(const Address& to, const Wad& amount);
    void burn(const Address& from, const Wad& amount);

private:
    using Allowances = std::unordered_map<Address, Wad, AddressHash>;

    void move(const Address& from, const Address& to, const Wad& amount);

    Address address_;
    std::string symbol_;
    Wad total_supply_;
    std::unordered_map<Address, Wad, AddressHash> balances_;
    std::unordered_map<Address, Allowances, AddressHash> allowances_;
};

}  // namespace ratevault
