#ifndef LEVER_CONFIG_HPP
#define LEVER_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chain.hpp"
#include "dex.hpp"
#include "types.hpp"

namespace lever {

class DeviationSentinel;
class Undertaker;

// =============================================================================
// Deployment Settings
// Addresses are kept as written ("0x..." or a chain label) and resolved
// against a Chain when the configuration is applied.
// =============================================================================

struct SentinelTokenSettings {
    std::string asset;
    uint8_t max_deviation_percent = 0;
    DexKind dex = DexKind::CONCENTRATED;
    std::string pool;
    bool enabled = true;
};

struct MarketExpirySettings {
    std::string market;
    uint64_t expiry = 0;
    bool can_unlist = false;
    U256 unlist_deposit_threshold;
};

// =============================================================================
// DeploymentConfig
//
// {
//   "log_level": "info",
//   "log_file": "lever.log",
//   "swap_helper": { "backend_signer": "backend" },
//   "sentinel": {
//     "keepers": ["keeper"],
//     "tokens": [{ "asset": "BTCB", "max_deviation_percent": 10,
//                  "dex": "concentrated", "pool": "BTCB/USDT", "enabled": true }]
//   },
//   "undertaker": {
//     "global_deposit_threshold": "1000000000000000000000",
//     "market_expiries": [{ "market": "vDOGE", "expiry": 1700086400,
//                           "can_unlist": true, "unlist_deposit_threshold": "0" }]
//   }
// }
// =============================================================================

class DeploymentConfig {
public:
    std::string log_level = "warning";
    std::optional<std::string> log_file;
    std::optional<std::string> swap_backend_signer;

    std::vector<std::string> sentinel_keepers;
    std::vector<SentinelTokenSettings> sentinel_tokens;

    std::optional<U256> global_deposit_threshold;
    std::vector<MarketExpirySettings> market_expiries;

    DeploymentConfig() = default;

    // Throw std::runtime_error on unreadable or malformed input
    static DeploymentConfig from_file(std::string_view path);
    static DeploymentConfig from_json(std::string_view content);
    static DeploymentConfig from_json(const nlohmann::json& doc);
};

// Logger level and sink
void apply_logging(const DeploymentConfig& config);

// Keepers and token configs through the governance setters (ACM applies);
// all or nothing
void apply_sentinel_config(const DeploymentConfig& config, Chain& chain, DeviationSentinel& sentinel,
                           const Address& governance);

void apply_undertaker_config(const DeploymentConfig& config, Chain& chain, Undertaker& undertaker,
                             const Address& governance);

} // namespace lever

#endif // LEVER_CONFIG_HPP
