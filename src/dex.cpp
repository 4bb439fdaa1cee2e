// =============================================================================
// dex.cpp - Simulated DEX Pools and Price Derivation
// =============================================================================

#include "lever/dex.hpp"

#include <stdexcept>
#include <string>

#include <boost/multiprecision/integer.hpp>

#include "lever/error.hpp"

namespace lever {

const char* dex_kind_name(DexKind kind) {
    switch (kind) {
        case DexKind::CONCENTRATED: return "concentrated";
        case DexKind::RESERVE_RATIO: return "reserve_ratio";
    }
    return "unknown";
}

DexPoolRegistry::DexPoolRegistry(Chain& chain) : chain_(chain), state_(chain) {}

Address DexPoolRegistry::create_concentrated_pool(const Address& token0, const Address& token1,
                                                  const U256& sqrt_price_x96, const std::string& label) {
    return chain_.transact([&] {
        if (is_zero(token0) || is_zero(token1)) throw ContractError(ErrorCode::ZeroAddress);
        Address pool = chain_.create_address(label.empty() ? "ConcentratedPool" : label);
        state_->concentrated[pool] = ConcentratedPool{token0, token1, sqrt_price_x96};
        chain_.emit(pool, "Initialize", {{"sqrtPriceX96", sqrt_price_x96.str()}});
        return pool;
    });
}

Address DexPoolRegistry::create_reserve_pool(const Address& token0, const Address& token1,
                                             const U256& reserve0, const U256& reserve1, const std::string& label) {
    return chain_.transact([&] {
        if (is_zero(token0) || is_zero(token1)) throw ContractError(ErrorCode::ZeroAddress);
        Address pool = chain_.create_address(label.empty() ? "ReservePool" : label);
        state_->reserves[pool] = ReservePool{token0, token1, reserve0, reserve1};
        chain_.emit(pool, "Sync", {{"reserve0", reserve0.str()}, {"reserve1", reserve1.str()}});
        return pool;
    });
}

void DexPoolRegistry::set_sqrt_price(const Address& pool, const U256& sqrt_price_x96) {
    chain_.transact([&] {
        auto it = state_->concentrated.find(pool);
        if (it == state_->concentrated.end()) throw ContractError(ErrorCode::InvalidPool, pool);
        it->second.sqrt_price_x96 = sqrt_price_x96;
        chain_.emit(pool, "Swap", {{"sqrtPriceX96", sqrt_price_x96.str()}});
    });
}

void DexPoolRegistry::set_reserves(const Address& pool, const U256& reserve0, const U256& reserve1) {
    chain_.transact([&] {
        auto it = state_->reserves.find(pool);
        if (it == state_->reserves.end()) throw ContractError(ErrorCode::InvalidPool, pool);
        it->second.reserve0 = reserve0;
        it->second.reserve1 = reserve1;
        chain_.emit(pool, "Sync", {{"reserve0", reserve0.str()}, {"reserve1", reserve1.str()}});
    });
}

std::optional<ConcentratedPool> DexPoolRegistry::concentrated(const Address& pool) const {
    return chain_.read([&]() -> std::optional<ConcentratedPool> {
        auto it = state_.get().concentrated.find(pool);
        if (it == state_.get().concentrated.end()) return std::nullopt;
        return it->second;
    });
}

std::optional<ReservePool> DexPoolRegistry::reserves(const Address& pool) const {
    return chain_.read([&]() -> std::optional<ReservePool> {
        auto it = state_.get().reserves.find(pool);
        if (it == state_.get().reserves.end()) return std::nullopt;
        return it->second;
    });
}

// =============================================================================
// DEX Price Math
// =============================================================================

namespace dex_math {

U256 q96() {
    return U256(1) << 96;
}

U256 price_from_sqrt_price(const U256& sqrt_price_x96, const U256& reference_price, bool token_is_token0) {
    // sqrtP^2 can reach 2^320, keep the whole product in 512 bits
    U512 price_x192 = U512(sqrt_price_x96) * U512(sqrt_price_x96);
    U512 q192 = U512(1) << 192;

    if (token_is_token0) {
        return amounts::narrow(price_x192 * U512(reference_price) / q192);
    }
    if (price_x192 == 0) throw ContractError(ErrorCode::InvalidPool, "zero sqrtPriceX96");
    return amounts::narrow(U512(reference_price) * q192 / price_x192);
}

U256 price_from_reserves(const U256& reference_reserve, const U256& target_reserve, const U256& reference_price) {
    if (target_reserve == 0) throw ContractError(ErrorCode::InvalidPool, "empty reserve");
    return amounts::mul_div(reference_reserve, reference_price, target_reserve);
}

U256 encode_sqrt_price_x96(const U256& amount1, const U256& amount0) {
    if (amount0 == 0) throw std::domain_error("encode_sqrt_price_x96: zero denominator");
    U512 ratio_x192 = (U512(amount1) << 192) / U512(amount0);
    return amounts::narrow(boost::multiprecision::sqrt(ratio_x192));
}

} // namespace dex_math

U256 dex_price(const DexPoolRegistry& pools, const IPriceOracle& reference,
               DexKind kind, const Address& pool, const Address& token) {
    switch (kind) {
        case DexKind::CONCENTRATED: {
            auto state = pools.concentrated(pool);
            if (!state) throw ContractError(ErrorCode::InvalidPool, pool);
            if (token != state->token0 && token != state->token1) throw ContractError(ErrorCode::InvalidPool, pool);

            bool is_token0 = token == state->token0;
            const Address& other = is_token0 ? state->token1 : state->token0;
            return dex_math::price_from_sqrt_price(state->sqrt_price_x96, reference.get_price(other), is_token0);
        }
        case DexKind::RESERVE_RATIO: {
            auto state = pools.reserves(pool);
            if (!state) throw ContractError(ErrorCode::InvalidPool, pool);
            if (token != state->token0 && token != state->token1) throw ContractError(ErrorCode::InvalidPool, pool);

            bool is_token0 = token == state->token0;
            const Address& other = is_token0 ? state->token1 : state->token0;
            const U256& target_reserve = is_token0 ? state->reserve0 : state->reserve1;
            const U256& reference_reserve = is_token0 ? state->reserve1 : state->reserve0;
            return dex_math::price_from_reserves(reference_reserve, target_reserve, reference.get_price(other));
        }
    }
    throw ContractError(ErrorCode::UnsupportedDEX, std::to_string(static_cast<int>(kind)));
}

} // namespace lever
