#ifndef LEVER_UNDERTAKER_HPP
#define LEVER_UNDERTAKER_HPP

#include <map>
#include <string>

#include "access.hpp"
#include "chain.hpp"
#include "market.hpp"
#include "oracle.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Market Expiry
// =============================================================================

struct MarketExpiry {
    uint64_t expiry = 0;                 // unix seconds, 0 = not set
    bool can_unlist = false;
    U256 unlist_deposit_threshold;       // USD, 1e18 scaled
};

// =============================================================================
// Undertaker - winds down markets that are too small or past their expiry
// =============================================================================

class Undertaker {
public:
    Undertaker(Chain& chain, const AccessControlManager& acm, IMarketService& comptroller,
               const IResilientOracle& oracle);

    // Non-copyable
    Undertaker(const Undertaker&) = delete;
    Undertaker& operator=(const Undertaker&) = delete;

    static inline const std::string SET_GLOBAL_DEPOSIT_THRESHOLD = "setGlobalDepositThreshold(uint256)";
    static inline const std::string SET_MARKET_EXPIRY = "setMarketExpiry(address,uint256,bool,uint256)";

    Address address() const { return self_; }

    void set_global_deposit_threshold(const Address& caller, const U256& usd);
    void set_market_expiry(const Address& caller, const Address& market, uint64_t expiry,
                           bool can_unlist, const U256& unlist_deposit_threshold);

    U256 global_deposit_threshold() const;
    MarketExpiry market_expiry(const Address& market) const;
    bool is_market_paused(const Address& market) const;

    // total_supply * exchange_rate * underlying_price, 1e18 scaled USD
    U256 total_deposits_usd(const Address& market) const;

    bool can_pause_market(const Address& market) const;
    bool can_unlist_market(const Address& market) const;

    // Anyone may call; reverts MarketNotPausable / MarketNotUnlistable
    void pause_market(const Address& market);
    void unlist_market(const Address& market);

private:
    struct State {
        U256 global_deposit_threshold;
        std::map<Address, MarketExpiry> expiries;
        std::map<Address, bool> paused;
    };

    bool expired(const MarketExpiry& expiry) const;

    Chain& chain_;
    const AccessControlManager& acm_;
    IMarketService& comptroller_;
    const IResilientOracle& oracle_;
    Address self_;
    Storage<State> state_;
};

} // namespace lever

#endif // LEVER_UNDERTAKER_HPP
