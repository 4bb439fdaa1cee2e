// =============================================================================
// sentinel.cpp - Price Deviation Sentinel Implementation
// =============================================================================

#include "lever/sentinel.hpp"

#include <string>

#include "lever/error.hpp"
#include "lever/log.hpp"

namespace lever {

namespace {

constexpr uint8_t MAX_DEVIATION_PERCENT = 100;

} // namespace

DeviationSentinel::DeviationSentinel(Chain& chain, const AccessControlManager& acm, IMarketService& comptroller,
                                     const IResilientOracle& oracle, const DexPoolRegistry& pools)
    : chain_(chain),
      acm_(acm),
      comptroller_(comptroller),
      oracle_(oracle),
      pools_(pools),
      self_(chain.create_address("DeviationSentinel")),
      state_(chain) {}

// =============================================================================
// Governance
// =============================================================================

void DeviationSentinel::set_token_config(const Address& caller, const Address& asset, const TokenConfig& config) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, SET_TOKEN_CONFIG);
        if (is_zero(asset) || is_zero(config.pool)) throw ContractError(ErrorCode::ZeroAddress);
        if (config.max_deviation_percent == 0) throw ContractError(ErrorCode::ZeroDeviation);
        if (config.max_deviation_percent > MAX_DEVIATION_PERCENT) {
            throw ContractError(ErrorCode::ExceedsMaxDeviation, std::to_string(config.max_deviation_percent));
        }

        state_->configs[asset] = config;
        chain_.emit(self_, "TokenConfigUpdated",
                    {{"token", to_hex(asset)},
                     {"deviation", config.max_deviation_percent},
                     {"dex", static_cast<int>(config.dex)},
                     {"pool", to_hex(config.pool)},
                     {"enabled", config.enabled}});
    });
}

void DeviationSentinel::set_trusted_keeper(const Address& caller, const Address& keeper, bool trusted) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, SET_TRUSTED_KEEPER);
        if (is_zero(keeper)) throw ContractError(ErrorCode::ZeroAddress);

        if (trusted) {
            state_->keepers.insert(keeper);
        } else {
            state_->keepers.erase(keeper);
        }
        chain_.emit(self_, "TrustedKeeperUpdated", {{"keeper", to_hex(keeper)}, {"isTrusted", trusted}});
    });
}

// =============================================================================
// Views
// =============================================================================

bool DeviationSentinel::is_trusted_keeper(const Address& keeper) const {
    return chain_.read([&] { return state_.get().keepers.count(keeper) != 0; });
}

std::optional<TokenConfig> DeviationSentinel::token_config(const Address& asset) const {
    return chain_.read([&]() -> std::optional<TokenConfig> {
        auto it = state_.get().configs.find(asset);
        if (it == state_.get().configs.end()) return std::nullopt;
        return it->second;
    });
}

MarketInterventionState DeviationSentinel::market_state(const Address& market) const {
    return chain_.read([&] {
        auto it = state_.get().markets.find(market);
        return it == state_.get().markets.end() ? MarketInterventionState{} : it->second;
    });
}

const TokenConfig& DeviationSentinel::require_config(const State& state, const Address& asset) const {
    auto it = state.configs.find(asset);
    if (it == state.configs.end()) throw ContractError(ErrorCode::TokenNotConfigured, asset);
    return it->second;
}

U256 DeviationSentinel::get_dex_price(const Address& asset) const {
    return chain_.read([&] {
        const TokenConfig& config = require_config(state_.get(), asset);
        return dex_price(pools_, oracle_, config.dex, config.pool, asset);
    });
}

DeviationResult DeviationSentinel::check_price_deviation(const Address& market) const {
    return chain_.read([&] {
        Address asset = comptroller_.underlying(market);
        const TokenConfig& config = require_config(state_.get(), asset);

        DeviationResult result;
        result.oracle_price = oracle_.get_price(asset);
        result.dex_price = dex_price(pools_, oracle_, config.dex, config.pool, asset);

        // Zero oracle price reports the maximum deviation
        if (result.oracle_price == 0) {
            result.has_deviation = true;
            result.deviation_percent = MAX_U256;
            return result;
        }

        U256 difference = result.dex_price > result.oracle_price ? result.dex_price - result.oracle_price
                                                                 : result.oracle_price - result.dex_price;
        result.deviation_percent = amounts::mul_div(difference, U256(100), result.oracle_price);
        result.has_deviation = result.deviation_percent > config.max_deviation_percent;
        return result;
    });
}

// =============================================================================
// Keeper
// =============================================================================

void DeviationSentinel::handle_deviation(const Address& caller, const Address& market) {
    chain_.transact([&] {
        if (state_.get().keepers.count(caller) == 0) throw ContractError(ErrorCode::UnauthorizedKeeper, caller);

        Address asset = comptroller_.underlying(market);
        if (!require_config(state_.get(), asset).enabled) throw ContractError(ErrorCode::TokenMonitoringDisabled, asset);

        DeviationResult result = check_price_deviation(market);
        MarketInterventionState intervention = market_state(market);

        Logger::debug("sentinel: {} oracle={} dex={} deviation={}%", to_hex(market),
                      result.oracle_price.str(), result.dex_price.str(), result.deviation_percent.str());

        if (result.has_deviation) {
            if (result.dex_price > result.oracle_price) {
                if (!intervention.borrow_paused) pause_borrow(market, intervention);
            } else {
                if (!intervention.collateral_factor_modified) zero_collateral_factor(market, intervention);
            }
        } else {
            if (intervention.borrow_paused) unpause_borrow(market, intervention);
            if (intervention.collateral_factor_modified) restore_collateral_factor(market, intervention);
        }

        state_->markets[market] = intervention;
    });
}

void DeviationSentinel::pause_borrow(const Address& market, MarketInterventionState& intervention) {
    // Never take ownership of a pause someone else put in place
    if (comptroller_.action_paused(market, Action::BORROW)) {
        Logger::debug("sentinel: borrow on {} already paused externally", to_hex(market));
        return;
    }

    comptroller_.set_actions_paused(self_, {market}, {Action::BORROW}, true);
    intervention.borrow_paused = true;
    chain_.emit(self_, "BorrowPaused", {{"market", to_hex(market)}});
    Logger::warning("sentinel: paused borrowing on {}", to_hex(market));
}

void DeviationSentinel::unpause_borrow(const Address& market, MarketInterventionState& intervention) {
    comptroller_.set_actions_paused(self_, {market}, {Action::BORROW}, false);
    intervention.borrow_paused = false;
    chain_.emit(self_, "BorrowUnpaused", {{"market", to_hex(market)}});
    Logger::info("sentinel: unpaused borrowing on {}", to_hex(market));
}

void DeviationSentinel::zero_collateral_factor(const Address& market, MarketInterventionState& intervention) {
    if (comptroller_.topology() == PoolTopology::CORE) {
        uint32_t last = comptroller_.last_pool_id();
        for (uint32_t pool_id = 0; pool_id <= last; ++pool_id) {
            PoolMarket entry = comptroller_.pool_market(pool_id, market);
            if (!entry.listed) continue;

            intervention.pool_factors[pool_id] = PoolFactors{entry.collateral_factor, entry.liquidation_threshold};
            comptroller_.set_collateral_factor(self_, pool_id, market, U256(0), entry.liquidation_threshold);
        }
    } else {
        PoolMarket entry = comptroller_.pool_market(0, market);
        intervention.saved_collateral_factor = entry.collateral_factor;
        intervention.saved_liquidation_threshold = entry.liquidation_threshold;
        comptroller_.set_collateral_factor(self_, 0, market, U256(0), entry.liquidation_threshold);
    }

    intervention.collateral_factor_modified = true;
    chain_.emit(self_, "CollateralFactorZeroed", {{"market", to_hex(market)}});
    Logger::warning("sentinel: zeroed collateral factor of {}", to_hex(market));
}

void DeviationSentinel::restore_collateral_factor(const Address& market, MarketInterventionState& intervention) {
    if (comptroller_.topology() == PoolTopology::CORE) {
        for (const auto& [pool_id, factors] : intervention.pool_factors) {
            comptroller_.set_collateral_factor(self_, pool_id, market, factors.collateral_factor,
                                               factors.liquidation_threshold);
        }
    } else {
        comptroller_.set_collateral_factor(self_, 0, market, intervention.saved_collateral_factor,
                                           intervention.saved_liquidation_threshold);
    }

    intervention.pool_factors.clear();
    intervention.saved_collateral_factor = 0;
    intervention.saved_liquidation_threshold = 0;
    intervention.collateral_factor_modified = false;
    chain_.emit(self_, "CollateralFactorRestored", {{"market", to_hex(market)}});
    Logger::info("sentinel: restored collateral factor of {}", to_hex(market));
}

} // namespace lever
