#ifndef LEVER_SENTINEL_ORACLE_HPP
#define LEVER_SENTINEL_ORACLE_HPP

#include <map>
#include <string>

#include "access.hpp"
#include "chain.hpp"
#include "oracle.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// SentinelOracle - routes each token to the DEX oracle configured for it
// =============================================================================

class SentinelOracle : public IPriceOracle {
public:
    SentinelOracle(Chain& chain, const AccessControlManager& acm);

    // Non-copyable
    SentinelOracle(const SentinelOracle&) = delete;
    SentinelOracle& operator=(const SentinelOracle&) = delete;

    static inline const std::string SET_TOKEN_ORACLE_CONFIG = "setTokenOracleConfig(address,address)";

    Address address() const override { return self_; }

    // oracle must outlive this router; nullptr is rejected as ZeroAddress
    void set_token_oracle_config(const Address& caller, const Address& token, const IPriceOracle* oracle);
    const IPriceOracle* token_oracle(const Address& token) const;

    U256 get_price(const Address& token) const override;

private:
    Chain& chain_;
    const AccessControlManager& acm_;
    Address self_;
    Storage<std::map<Address, const IPriceOracle*>> oracles_;
};

} // namespace lever

#endif // LEVER_SENTINEL_ORACLE_HPP
