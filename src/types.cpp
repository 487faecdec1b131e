// Ratevault - Types Implementation

#include <ratevault/types.hpp>

#include <stdexcept>

namespace ratevault::addresses {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw std::invalid_argument("Address must be 40 hex digits: '" + std::string(hex) + "'");
    }

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex digit in address: '" + std::string(hex) + "'");
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

}  // namespace ratevault::addresses
