// Ratevault - Core Types
// 256-bit fixed-point amounts, addresses and market snapshots

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace ratevault {

// =============================================================================
// Numeric Types
// =============================================================================

// Amounts, rates and ratios share the market's 256-bit unsigned width.
using Wad = boost::multiprecision::uint256_t;
using Timestamp = uint64_t;

// =============================================================================
// Address (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Helper to create an address from a small integer id (tests, fixtures)
constexpr Address from_id(uint32_t id) {
    Address addr = {};
    addr[16] = static_cast<uint8_t>((id >> 24) & 0xFF);
    addr[17] = static_cast<uint8_t>((id >> 16) & 0xFF);
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without "0x"; throws std::invalid_argument on bad input
Address from_hex(std::string_view hex);

}  // namespace addresses

struct AddressHash {
    size_t operator()(const Address& addr) const noexcept {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Market Snapshot
// =============================================================================

// Accrual state as last written by the market. Observed, never mutated here.
struct MarketSnapshot {
    Timestamp accrual_timestamp = 0;
    Wad stored_exchange_rate;
    Wad cash;
    Wad total_borrows;          // borrows as of accrual_timestamp
    Wad total_reserves;         // reserves as of accrual_timestamp
    Wad total_supply;           // principal tokens outstanding
    Wad reserve_factor;         // WAD fraction, e.g. 0.1e18
    Wad initial_exchange_rate;  // used while total_supply == 0
};

// One simulated accrual step
struct AccrualResult {
    Wad interest_accumulated;
    Wad total_borrows;
    Wad total_reserves;
    Wad exchange_rate;
};

}  // namespace ratevault
