#ifndef LEVER_ORACLE_HPP
#define LEVER_ORACLE_HPP

#include <map>

#include "chain.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Oracle Interfaces
// Prices use the resilient-oracle format: USD per whole token scaled to
// 10^(36 - token decimals), i.e. USD per smallest unit scaled by 1e36.
// =============================================================================

class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;
    virtual Address address() const = 0;
    virtual U256 get_price(const Address& asset) const = 0;
};

class IResilientOracle : public IPriceOracle {
public:
    virtual U256 get_underlying_price(const Address& market) const = 0;
};

// =============================================================================
// FixedPriceOracle - directly set prices (feed simulation)
// Unset prices read as zero.
// =============================================================================

class FixedPriceOracle : public IResilientOracle {
public:
    explicit FixedPriceOracle(Chain& chain);

    Address address() const override { return self_; }

    void set_price(const Address& asset, const U256& price);
    void set_market_underlying(const Address& market, const Address& underlying);

    U256 get_price(const Address& asset) const override;
    U256 get_underlying_price(const Address& market) const override;

private:
    struct State {
        std::map<Address, U256> prices;
        std::map<Address, Address> underlyings;
    };

    Chain& chain_;
    Address self_;
    Storage<State> state_;
};

} // namespace lever

#endif // LEVER_ORACLE_HPP
