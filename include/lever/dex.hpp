#ifndef LEVER_DEX_HPP
#define LEVER_DEX_HPP

#include <map>
#include <optional>
#include <string>

#include "chain.hpp"
#include "oracle.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Exchange Families
// =============================================================================

enum class DexKind : uint8_t {
    CONCENTRATED = 0,   // Uniswap V3 style, priced from slot0.sqrtPriceX96
    RESERVE_RATIO = 1,  // PancakeSwap pair style, priced from reserves
};

const char* dex_kind_name(DexKind kind);

// =============================================================================
// Pool State
// =============================================================================

struct ConcentratedPool {
    Address token0;
    Address token1;
    U256 sqrt_price_x96;    // sqrt(token1 / token0) as Q64.96
};

struct ReservePool {
    Address token0;
    Address token1;
    U256 reserve0;
    U256 reserve1;
};

// =============================================================================
// DexPoolRegistry - simulated AMM pool state read by the DEX oracles
// =============================================================================

class DexPoolRegistry {
public:
    explicit DexPoolRegistry(Chain& chain);

    // Non-copyable
    DexPoolRegistry(const DexPoolRegistry&) = delete;
    DexPoolRegistry& operator=(const DexPoolRegistry&) = delete;

    Address create_concentrated_pool(const Address& token0, const Address& token1,
                                     const U256& sqrt_price_x96, const std::string& label = "");
    Address create_reserve_pool(const Address& token0, const Address& token1,
                                const U256& reserve0, const U256& reserve1, const std::string& label = "");

    void set_sqrt_price(const Address& pool, const U256& sqrt_price_x96);
    void set_reserves(const Address& pool, const U256& reserve0, const U256& reserve1);

    std::optional<ConcentratedPool> concentrated(const Address& pool) const;
    std::optional<ReservePool> reserves(const Address& pool) const;

private:
    struct State {
        std::map<Address, ConcentratedPool> concentrated;
        std::map<Address, ReservePool> reserves;
    };

    Chain& chain_;
    Storage<State> state_;
};

// =============================================================================
// DEX Price Math
// All prices use the oracle format (USD per smallest unit scaled by 1e36), so
// decimal differences between the two pool tokens cancel out.
// =============================================================================

namespace dex_math {

// 2^96
U256 q96();

// Price of the queried token given the reference token's price.
// token_is_token0: sqrtP^2 * ref / 2^192, otherwise ref * 2^192 / sqrtP^2.
U256 price_from_sqrt_price(const U256& sqrt_price_x96, const U256& reference_price, bool token_is_token0);

// reference_reserve * reference_price / target_reserve
U256 price_from_reserves(const U256& reference_reserve, const U256& target_reserve,
                         const U256& reference_price);

// sqrt(amount1 / amount0) * 2^96, floored
U256 encode_sqrt_price_x96(const U256& amount1, const U256& amount0);

} // namespace dex_math

// Price `token` against the other token of `pool`, reading the other token's
// price from `reference`. Throws InvalidPool or UnsupportedDEX.
U256 dex_price(const DexPoolRegistry& pools, const IPriceOracle& reference,
               DexKind kind, const Address& pool, const Address& token);

} // namespace lever

#endif // LEVER_DEX_HPP
