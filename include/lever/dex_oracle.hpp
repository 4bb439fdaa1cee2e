#ifndef LEVER_DEX_ORACLE_HPP
#define LEVER_DEX_ORACLE_HPP

#include <map>
#include <string>

#include "access.hpp"
#include "chain.hpp"
#include "dex.hpp"
#include "oracle.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// DexPriceOracle - token price from one exchange family's pools
// One instance per family (concentrated liquidity, reserve ratio). The other
// token of each pool is priced by the resilient oracle.
// =============================================================================

class DexPriceOracle : public IPriceOracle {
public:
    DexPriceOracle(Chain& chain, const AccessControlManager& acm, const DexPoolRegistry& pools,
                   const IPriceOracle& resilient_oracle, DexKind kind);

    // Non-copyable
    DexPriceOracle(const DexPriceOracle&) = delete;
    DexPriceOracle& operator=(const DexPriceOracle&) = delete;

    static inline const std::string SET_POOL_CONFIG = "setPoolConfig(address,address)";

    Address address() const override { return self_; }
    DexKind kind() const { return kind_; }

    void set_pool_config(const Address& caller, const Address& token, const Address& pool);
    Address token_pool(const Address& token) const;

    // Throws TokenNotConfigured for a token without a pool
    U256 get_price(const Address& token) const override;

private:
    Chain& chain_;
    const AccessControlManager& acm_;
    const DexPoolRegistry& pools_;
    const IPriceOracle& resilient_oracle_;
    DexKind kind_;
    Address self_;
    Storage<std::map<Address, Address>> token_pools_;
};

} // namespace lever

#endif // LEVER_DEX_ORACLE_HPP
