// =============================================================================
// sentinel_oracle.cpp - Per-token DEX Oracle Router
// =============================================================================

#include "lever/sentinel_oracle.hpp"
#include "lever/error.hpp"

namespace lever {

SentinelOracle::SentinelOracle(Chain& chain, const AccessControlManager& acm)
    : chain_(chain), acm_(acm), self_(chain.create_address("SentinelOracle")), oracles_(chain) {}

void SentinelOracle::set_token_oracle_config(const Address& caller, const Address& token,
                                             const IPriceOracle* oracle) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, SET_TOKEN_ORACLE_CONFIG);
        if (is_zero(token) || oracle == nullptr) throw ContractError(ErrorCode::ZeroAddress);

        oracles_.mut()[token] = oracle;
        chain_.emit(self_, "TokenOracleConfigUpdated",
                    {{"token", to_hex(token)}, {"oracle", to_hex(oracle->address())}});
    });
}

const IPriceOracle* SentinelOracle::token_oracle(const Address& token) const {
    return chain_.read([&]() -> const IPriceOracle* {
        auto it = oracles_.get().find(token);
        return it == oracles_.get().end() ? nullptr : it->second;
    });
}

U256 SentinelOracle::get_price(const Address& token) const {
    const IPriceOracle* oracle = token_oracle(token);
    if (oracle == nullptr) throw ContractError(ErrorCode::TokenNotConfigured, token);
    return oracle->get_price(token);
}

} // namespace lever
