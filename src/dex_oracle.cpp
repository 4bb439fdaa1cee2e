// =============================================================================
// dex_oracle.cpp - DEX Price Oracle
// =============================================================================

#include "lever/dex_oracle.hpp"
#include "lever/error.hpp"

namespace lever {

DexPriceOracle::DexPriceOracle(Chain& chain, const AccessControlManager& acm, const DexPoolRegistry& pools,
                               const IPriceOracle& resilient_oracle, DexKind kind)
    : chain_(chain),
      acm_(acm),
      pools_(pools),
      resilient_oracle_(resilient_oracle),
      kind_(kind),
      self_(chain.create_address(kind == DexKind::CONCENTRATED ? "UniswapOracle" : "PancakeSwapOracle")),
      token_pools_(chain) {}

void DexPriceOracle::set_pool_config(const Address& caller, const Address& token, const Address& pool) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, SET_POOL_CONFIG);
        if (is_zero(token) || is_zero(pool)) throw ContractError(ErrorCode::ZeroAddress);

        token_pools_.mut()[token] = pool;
        chain_.emit(self_, "PoolConfigUpdated", {{"token", to_hex(token)}, {"pool", to_hex(pool)}});
    });
}

Address DexPriceOracle::token_pool(const Address& token) const {
    return chain_.read([&] {
        auto it = token_pools_.get().find(token);
        return it == token_pools_.get().end() ? ZERO_ADDRESS : it->second;
    });
}

U256 DexPriceOracle::get_price(const Address& token) const {
    Address pool = token_pool(token);
    if (is_zero(pool)) throw ContractError(ErrorCode::TokenNotConfigured, token);
    return dex_price(pools_, resilient_oracle_, kind_, pool, token);
}

} // namespace lever
