// Ratevault - Fixed-Point Arithmetic Implementation

#include <ratevault/wad.hpp>
#include <ratevault/errors.hpp>

#include <stdexcept>

namespace ratevault::wad {

namespace {

// Products are formed at twice the width so overflow is observable
using Wide = boost::multiprecision::uint512_t;

constexpr size_t WAD_DECIMALS = 18;

Wad narrow(const Wide& v, const char* op) {
    if (v > Wide((std::numeric_limits<Wad>::max)())) {
        throw ArithmeticOverflow(op);
    }
    return static_cast<Wad>(v);
}

bool all_digits(std::string_view s) {
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

Wad pow10(size_t n) {
    Wad r = 1;
    for (size_t i = 0; i < n; ++i) r *= 10;
    return r;
}

}  // namespace

// =============================================================================
// Checked Arithmetic
// =============================================================================

Wad checked_mul(const Wad& a, const Wad& b) {
    return narrow(Wide(a) * Wide(b), "checked_mul");
}

Wad checked_add(const Wad& a, const Wad& b) {
    return narrow(Wide(a) + Wide(b), "checked_add");
}

Wad checked_sub(const Wad& a, const Wad& b) {
    if (b > a) {
        throw ArithmeticUnderflow("checked_sub");
    }
    return a - b;
}

Wad mul_div_down(const Wad& x, const Wad& y, const Wad& d) {
    if (d == 0) {
        throw DivisionByZero("mul_div_down");
    }
    // The intermediate product must itself fit in 256 bits
    Wad product = narrow(Wide(x) * Wide(y), "mul_div_down");
    return product / d;
}

Wad mul_div_up(const Wad& x, const Wad& y, const Wad& d) {
    if (d == 0) {
        throw DivisionByZero("mul_div_up");
    }
    Wad product = narrow(Wide(x) * Wide(y), "mul_div_up");
    if (product == 0) return 0;
    return (product - 1) / d + 1;
}

// =============================================================================
// Conversions
// =============================================================================

Wad from_int(uint64_t units) {
    return Wad(units) * WAD;
}

Wad parse(std::string_view s) {
    if (s.empty() || !all_digits(s)) {
        throw std::invalid_argument("Not an unsigned integer: '" + std::string(s) + "'");
    }
    Wad result = 0;
    for (char c : s) {
        result = checked_add(checked_mul(result, 10), Wad(c - '0'));
    }
    return result;
}

Wad parse_units(std::string_view s) {
    auto dot = s.find('.');
    std::string_view int_part = s.substr(0, dot);
    std::string_view frac_part =
        dot == std::string_view::npos ? std::string_view{} : s.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        throw std::invalid_argument("Not a decimal amount: '" + std::string(s) + "'");
    }
    if (!all_digits(int_part) || !all_digits(frac_part)) {
        throw std::invalid_argument("Not a decimal amount: '" + std::string(s) + "'");
    }
    if (frac_part.size() > WAD_DECIMALS) {
        throw std::invalid_argument("More than 18 decimals: '" + std::string(s) + "'");
    }

    Wad whole = int_part.empty() ? Wad(0) : parse(int_part);
    Wad frac = frac_part.empty() ? Wad(0) : parse(frac_part);
    frac *= pow10(WAD_DECIMALS - frac_part.size());

    return checked_add(checked_mul(whole, WAD), frac);
}

std::string to_string(const Wad& v) {
    Wad int_part = v / WAD;
    Wad frac_part = v % WAD;

    std::string result = int_part.str();
    if (frac_part == 0) return result;

    std::string frac_str = frac_part.str();
    frac_str.insert(0, WAD_DECIMALS - frac_str.size(), '0');

    // Trim trailing zeros
    frac_str.erase(frac_str.find_last_not_of('0') + 1);
    return result + "." + frac_str;
}

}  // namespace ratevault::wad
