#ifndef LEVER_TYPES_HPP
#define LEVER_TYPES_HPP

#include <cstdint>
#include <array>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace lever {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Bytes = std::vector<uint8_t>;

constexpr Address ZERO_ADDRESS = {};

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Deterministic address for the n-th allocated account/contract.
// Format: 0x1e5e0000000000000000000000000000nnnnnnnn
Address address_from_id(uint64_t id);

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional "0x" prefix; throws std::invalid_argument on bad input
Address address_from_hex(std::string_view hex);

// =============================================================================
// 256-bit Amounts
// Checked arithmetic: overflow throws std::overflow_error, underflow of an
// unsigned subtraction throws std::range_error (EVM checked math).
// =============================================================================

using U256 = boost::multiprecision::checked_uint256_t;
using U512 = boost::multiprecision::checked_uint512_t;

inline const U256 MAX_U256 = std::numeric_limits<U256>::max();
inline const U256 EXP_SCALE = U256(1000000000000000000ULL);  // 1e18 mantissa

namespace amounts {

U256 pow10(unsigned exponent);

// whole * 10^decimals
U256 units(uint64_t whole, unsigned decimals);

// Decimal text with optional fraction: parse_units("1.5", 18) == 1.5e18.
// Throws std::invalid_argument on malformed text or excess precision.
U256 parse_units(std::string_view text, unsigned decimals);

// Plain unsigned integer text (base 10)
U256 parse(std::string_view text);

// 512 -> 256 bit narrowing, throws std::overflow_error when it does not fit
U256 narrow(const U512& value);

// a * b / denominator with a 512-bit intermediate (truncating)
U256 mul_div(const U256& a, const U256& b, const U256& denominator);

// a * b / denominator rounded up
U256 mul_div_up(const U256& a, const U256& b, const U256& denominator);

inline std::string to_string(const U256& value) { return value.str(); }

} // namespace amounts

// Mantissa (1e18 scaled) helpers
namespace mantissa {

inline U256 mul(const U256& a, const U256& b) {
    return amounts::mul_div(a, b, EXP_SCALE);
}

inline U256 div(const U256& a, const U256& b) {
    return amounts::mul_div(a, EXP_SCALE, b);
}

} // namespace mantissa

} // namespace lever

#endif // LEVER_TYPES_HPP
