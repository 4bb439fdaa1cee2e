#ifndef LEVER_CONVERTER_HPP
#define LEVER_CONVERTER_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "types.hpp"

namespace lever {

// =============================================================================
// Swap Calls
// =============================================================================

// Send the converter's whole balance of token to `to`
struct SweepCall {
    Address token;
    Address to;
};

// Give `spender` an unlimited allowance on the converter's token balance
struct ApproveMaxCall {
    Address token;
    Address spender;
};

// Consume amount_in of token_in already held by the converter and pay
// amount_out of token_out to `to`
struct ExchangeCall {
    Address token_in;
    U256 amount_in;
    Address token_out;
    U256 amount_out;
    Address to;
};

using SwapCall = std::variant<SweepCall, ApproveMaxCall, ExchangeCall>;

// =============================================================================
// Swap Instructions (pre-signed multicall)
// =============================================================================

struct SwapInstructions {
    std::vector<SwapCall> calls;
    uint64_t deadline = std::numeric_limits<uint64_t>::max();
    std::string salt;                 // replay protection for signed batches
    std::optional<Address> signer;    // unsigned batches skip the signer check
};

// =============================================================================
// ITokenConverter - opaque token conversion service
// Callers transfer input tokens in, then measure output by balance deltas.
// =============================================================================

class ITokenConverter {
public:
    virtual ~ITokenConverter() = default;

    virtual Address address() const = 0;
    virtual void multicall(const Address& caller, const SwapInstructions& instructions) = 0;
};

} // namespace lever

#endif // LEVER_CONVERTER_HPP
