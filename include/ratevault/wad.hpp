// Ratevault - Fixed-Point Arithmetic
// WAD = 18 decimal places, floor rounding, checked 256-bit operations

#pragma once

#include <ratevault/types.hpp>

#include <limits>
#include <string>
#include <string_view>

namespace ratevault {

// =============================================================================
// Constants
// =============================================================================

inline const Wad WAD{"1000000000000000000"};  // 1e18

// Largest representable amount; max_deposit/max_mint when unbounded
inline const Wad MAX_WAD = (std::numeric_limits<Wad>::max)();

namespace wad {

// =============================================================================
// Checked Arithmetic
// =============================================================================

// a * b; throws ArithmeticOverflow past 256 bits
Wad checked_mul(const Wad& a, const Wad& b);

// a + b; throws ArithmeticOverflow past 256 bits
Wad checked_add(const Wad& a, const Wad& b);

// a - b; throws ArithmeticUnderflow when b > a
Wad checked_sub(const Wad& a, const Wad& b);

// floor(x * y / d); throws DivisionByZero, ArithmeticOverflow
Wad mul_div_down(const Wad& x, const Wad& y, const Wad& d);

// ceil(x * y / d); throws DivisionByZero, ArithmeticOverflow
Wad mul_div_up(const Wad& x, const Wad& y, const Wad& d);

// floor(a * b / 1e18)
inline Wad mul_wad_down(const Wad& a, const Wad& b) {
    return mul_div_down(a, b, WAD);
}

// floor(a * 1e18 / b)
inline Wad div_wad_down(const Wad& a, const Wad& b) {
    return mul_div_down(a, WAD, b);
}

// =============================================================================
// Conversions
// =============================================================================

// Whole units to WAD scale (from_int(3) == 3e18)
Wad from_int(uint64_t units);

// "1.25" -> 1.25e18. At most 18 fractional digits, no sign, no exponent.
// Throws std::invalid_argument.
Wad parse_units(std::string_view s);

// Plain base-10 integer string; throws std::invalid_argument
Wad parse(std::string_view s);

// 1.25e18 -> "1.25", 3e18 -> "3"
std::string to_string(const Wad& v);

}  // namespace wad

}  // namespace ratevault
