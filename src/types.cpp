// =============================================================================
// types.cpp - Address and Amount Helpers
// =============================================================================

#include "lever/types.hpp"

#include <cctype>
#include <stdexcept>

namespace lever {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Addresses
// =============================================================================

Address address_from_id(uint64_t id) {
    Address addr = {};
    addr[0] = 0x1e;
    addr[1] = 0x5e;
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

Address address_from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw std::invalid_argument("address must have 40 hex digits: " + std::string(hex));
    }

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

// =============================================================================
// Amounts
// =============================================================================

namespace amounts {

U256 pow10(unsigned exponent) {
    if (exponent > 77) {
        throw std::overflow_error("10^" + std::to_string(exponent) + " exceeds 256 bits");
    }
    U256 result = 1;
    for (unsigned i = 0; i < exponent; ++i) result *= 10;
    return result;
}

U256 units(uint64_t whole, unsigned decimals) {
    return U256(whole) * pow10(decimals);
}

U256 parse(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty amount");
    }
    U256 value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("invalid amount: " + std::string(text));
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value;
}

U256 parse_units(std::string_view text, unsigned decimals) {
    size_t dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    std::string_view fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

    if (fraction.size() > decimals) {
        throw std::invalid_argument("too many decimal places: " + std::string(text));
    }

    U256 value = whole.empty() ? U256(0) : parse(whole);
    value *= pow10(decimals);
    if (!fraction.empty()) {
        value += parse(fraction) * pow10(decimals - static_cast<unsigned>(fraction.size()));
    }
    return value;
}

U256 narrow(const U512& value) {
    if (value > static_cast<U512>(MAX_U256)) {
        throw std::overflow_error("value exceeds 256 bits");
    }
    return static_cast<U256>(value);
}

U256 mul_div(const U256& a, const U256& b, const U256& denominator) {
    if (denominator == 0) {
        throw std::domain_error("mul_div: division by zero");
    }
    U512 product = static_cast<U512>(a) * static_cast<U512>(b);
    return narrow(product / static_cast<U512>(denominator));
}

U256 mul_div_up(const U256& a, const U256& b, const U256& denominator) {
    if (denominator == 0) {
        throw std::domain_error("mul_div_up: division by zero");
    }
    U512 product = static_cast<U512>(a) * static_cast<U512>(b);
    U512 d = static_cast<U512>(denominator);
    U512 quotient = product / d;
    if (product % d != 0) quotient += 1;
    return narrow(quotient);
}

} // namespace amounts

} // namespace lever
