// =============================================================================
// undertaker.cpp - Market Lifecycle (pause and unlist)
// =============================================================================

#include "lever/undertaker.hpp"

#include "lever/error.hpp"
#include "lever/log.hpp"

namespace lever {

Undertaker::Undertaker(Chain& chain, const AccessControlManager& acm, IMarketService& comptroller,
                       const IResilientOracle& oracle)
    : chain_(chain),
      acm_(acm),
      comptroller_(comptroller),
      oracle_(oracle),
      self_(chain.create_address("Undertaker")),
      state_(chain) {}

void Undertaker::set_global_deposit_threshold(const Address& caller, const U256& usd) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, SET_GLOBAL_DEPOSIT_THRESHOLD);
        U256 old = state_.get().global_deposit_threshold;
        state_->global_deposit_threshold = usd;
        chain_.emit(self_, "GlobalDepositThresholdUpdated", {{"oldThreshold", old.str()}, {"newThreshold", usd.str()}});
    });
}

void Undertaker::set_market_expiry(const Address& caller, const Address& market, uint64_t expiry,
                                   bool can_unlist, const U256& unlist_deposit_threshold) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, SET_MARKET_EXPIRY);
        if (!comptroller_.is_listed(market)) throw ContractError(ErrorCode::MarketNotListed, market);

        state_->expiries[market] = MarketExpiry{expiry, can_unlist, unlist_deposit_threshold};
        chain_.emit(self_, "MarketExpirySet",
                    {{"market", to_hex(market)}, {"expiry", expiry}, {"canUnlist", can_unlist},
                     {"unlistDepositThreshold", unlist_deposit_threshold.str()}});
    });
}

U256 Undertaker::global_deposit_threshold() const {
    return chain_.read([&] { return state_.get().global_deposit_threshold; });
}

MarketExpiry Undertaker::market_expiry(const Address& market) const {
    return chain_.read([&] {
        auto it = state_.get().expiries.find(market);
        return it == state_.get().expiries.end() ? MarketExpiry{} : it->second;
    });
}

bool Undertaker::is_market_paused(const Address& market) const {
    return chain_.read([&] {
        auto it = state_.get().paused.find(market);
        return it != state_.get().paused.end() && it->second;
    });
}

U256 Undertaker::total_deposits_usd(const Address& market) const {
    U256 underlying = amounts::mul_div(comptroller_.total_supply(market),
                                       comptroller_.exchange_rate_stored(market), EXP_SCALE);
    return amounts::mul_div(underlying, oracle_.get_underlying_price(market), EXP_SCALE);
}

bool Undertaker::expired(const MarketExpiry& expiry) const {
    return expiry.expiry != 0 && chain_.now() >= expiry.expiry;
}

bool Undertaker::can_pause_market(const Address& market) const {
    return chain_.read([&] {
        if (is_market_paused(market)) return false;
        if (total_deposits_usd(market) < global_deposit_threshold()) return true;
        return expired(market_expiry(market));
    });
}

bool Undertaker::can_unlist_market(const Address& market) const {
    return chain_.read([&] {
        if (!is_market_paused(market)) return false;

        MarketExpiry expiry = market_expiry(market);
        if (!expiry.can_unlist || !expired(expiry)) return false;
        return total_deposits_usd(market) < expiry.unlist_deposit_threshold;
    });
}

void Undertaker::pause_market(const Address& market) {
    chain_.transact([&] {
        if (!can_pause_market(market)) throw ContractError(ErrorCode::MarketNotPausable, market);

        comptroller_.set_actions_paused(self_, {market}, {Action::MINT, Action::BORROW, Action::ENTER_MARKET}, true);

        uint32_t last = comptroller_.topology() == PoolTopology::CORE ? comptroller_.last_pool_id() : 0;
        for (uint32_t pool_id = 0; pool_id <= last; ++pool_id) {
            PoolMarket entry = comptroller_.pool_market(pool_id, market);
            if (!entry.listed) continue;
            comptroller_.set_collateral_factor(self_, pool_id, market, U256(0), entry.liquidation_threshold);
        }

        comptroller_.set_market_supply_caps(self_, {market}, {U256(0)});
        comptroller_.set_market_borrow_caps(self_, {market}, {U256(0)});

        state_->paused[market] = true;
        chain_.emit(self_, "MarketPaused", {{"market", to_hex(market)}});
        Logger::info("undertaker: paused {}", to_hex(market));
    });
}

void Undertaker::unlist_market(const Address& market) {
    chain_.transact([&] {
        if (!can_unlist_market(market)) throw ContractError(ErrorCode::MarketNotUnlistable, market);

        uint32_t code = comptroller_.unlist_market(self_, market);
        if (code != market_errors::OK) {
            throw ContractError(ErrorCode::MarketNotUnlistable, "code " + std::to_string(code));
        }

        chain_.emit(self_, "MarketUnlisted", {{"market", to_hex(market)}});
        Logger::info("undertaker: unlisted {}", to_hex(market));
    });
}

} // namespace lever
