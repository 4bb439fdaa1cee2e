// =============================================================================
// oracle.cpp - Fixed Price Oracle
// =============================================================================

#include "lever/oracle.hpp"

namespace lever {

FixedPriceOracle::FixedPriceOracle(Chain& chain)
    : chain_(chain), self_(chain.create_address("ResilientOracle")), state_(chain) {}

void FixedPriceOracle::set_price(const Address& asset, const U256& price) {
    chain_.transact([&] {
        state_->prices[asset] = price;
        chain_.emit(self_, "PricePosted", {{"asset", to_hex(asset)}, {"price", price.str()}});
    });
}

void FixedPriceOracle::set_market_underlying(const Address& market, const Address& underlying) {
    chain_.transact([&] {
        state_->underlyings[market] = underlying;
    });
}

U256 FixedPriceOracle::get_price(const Address& asset) const {
    return chain_.read([&] {
        auto it = state_->prices.find(asset);
        return it == state_->prices.end() ? U256(0) : it->second;
    });
}

U256 FixedPriceOracle::get_underlying_price(const Address& market) const {
    return chain_.read([&] {
        auto it = state_->underlyings.find(market);
        if (it == state_->underlyings.end()) return U256(0);
        auto price = state_->prices.find(it->second);
        return price == state_->prices.end() ? U256(0) : price->second;
    });
}

} // namespace lever
