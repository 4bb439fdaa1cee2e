#ifndef LEVER_SENTINEL_HPP
#define LEVER_SENTINEL_HPP

#include <map>
#include <optional>
#include <set>
#include <string>

#include "access.hpp"
#include "chain.hpp"
#include "dex.hpp"
#include "market.hpp"
#include "oracle.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Deviation Configuration
// =============================================================================

struct TokenConfig {
    uint8_t max_deviation_percent = 0;   // 1..100
    DexKind dex = DexKind::CONCENTRATED;
    Address pool;
    bool enabled = false;
};

// =============================================================================
// Market Intervention State
// =============================================================================

struct PoolFactors {
    U256 collateral_factor;
    U256 liquidation_threshold;
};

struct MarketInterventionState {
    bool borrow_paused = false;
    bool collateral_factor_modified = false;
    U256 saved_collateral_factor;          // isolated topology
    U256 saved_liquidation_threshold;
    std::map<uint32_t, PoolFactors> pool_factors;   // core topology, by pool id
};

struct DeviationResult {
    bool has_deviation = false;
    U256 oracle_price;
    U256 dex_price;
    U256 deviation_percent;
};

// =============================================================================
// DeviationSentinel
//
// Compares the resilient oracle with a DEX derived price for each configured
// asset. A trusted keeper triggers handle_deviation: a DEX price above the
// oracle pauses borrowing, a DEX price below it zeroes the collateral factor
// in every pool of the market. Both interventions are undone once the prices
// converge again.
// =============================================================================

class DeviationSentinel {
public:
    DeviationSentinel(Chain& chain, const AccessControlManager& acm, IMarketService& comptroller,
                      const IResilientOracle& oracle, const DexPoolRegistry& pools);

    // Non-copyable
    DeviationSentinel(const DeviationSentinel&) = delete;
    DeviationSentinel& operator=(const DeviationSentinel&) = delete;

    static inline const std::string SET_TOKEN_CONFIG = "setTokenConfig(address,(uint8,uint8,address,bool))";
    static inline const std::string SET_TRUSTED_KEEPER = "setTrustedKeeper(address,bool)";

    Address address() const { return self_; }

    // =========================================================================
    // Governance
    // =========================================================================

    void set_token_config(const Address& caller, const Address& asset, const TokenConfig& config);
    void set_trusted_keeper(const Address& caller, const Address& keeper, bool trusted);

    // =========================================================================
    // Views
    // =========================================================================

    bool is_trusted_keeper(const Address& keeper) const;
    std::optional<TokenConfig> token_config(const Address& asset) const;
    MarketInterventionState market_state(const Address& market) const;

    U256 get_dex_price(const Address& asset) const;

    // Ignores the enabled flag; throws TokenNotConfigured without a config
    DeviationResult check_price_deviation(const Address& market) const;

    // =========================================================================
    // Keeper
    // =========================================================================

    void handle_deviation(const Address& caller, const Address& market);

private:
    struct State {
        std::set<Address> keepers;
        std::map<Address, TokenConfig> configs;
        std::map<Address, MarketInterventionState> markets;
    };

    const TokenConfig& require_config(const State& state, const Address& asset) const;

    void pause_borrow(const Address& market, MarketInterventionState& intervention);
    void unpause_borrow(const Address& market, MarketInterventionState& intervention);
    void zero_collateral_factor(const Address& market, MarketInterventionState& intervention);
    void restore_collateral_factor(const Address& market, MarketInterventionState& intervention);

    Chain& chain_;
    const AccessControlManager& acm_;
    IMarketService& comptroller_;
    const IResilientOracle& oracle_;
    const DexPoolRegistry& pools_;
    Address self_;
    Storage<State> state_;
};

} // namespace lever

#endif // LEVER_SENTINEL_HPP
