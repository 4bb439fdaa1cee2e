// =============================================================================
// config.cpp - Deployment Configuration (JSON)
// =============================================================================

#include "lever/config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "lever/log.hpp"
#include "lever/sentinel.hpp"
#include "lever/undertaker.hpp"

namespace lever {

namespace {

using nlohmann::json;

// Amounts exceed 64 bits, so they are written as decimal strings; small
// values may also be plain JSON numbers
U256 parse_amount(const json& value, const char* field) {
    if (value.is_string()) return amounts::parse(value.get<std::string>());
    if (value.is_number_unsigned()) return U256(value.get<uint64_t>());
    throw std::runtime_error(std::string("invalid amount for ") + field);
}

DexKind parse_dex(const json& value) {
    if (value.is_string()) {
        const auto& name = value.get_ref<const std::string&>();
        if (name == "concentrated" || name == "uniswap") return DexKind::CONCENTRATED;
        if (name == "reserve_ratio" || name == "pancakeswap") return DexKind::RESERVE_RATIO;
        throw std::runtime_error("unknown dex kind: " + name);
    }
    // Numeric kinds are taken as is; pricing rejects kinds it does not know
    if (value.is_number_unsigned()) return static_cast<DexKind>(value.get<uint8_t>());
    throw std::runtime_error("invalid dex kind");
}

SentinelTokenSettings parse_token(const json& entry) {
    SentinelTokenSettings token;
    token.asset = entry.at("asset").get<std::string>();
    token.max_deviation_percent = entry.at("max_deviation_percent").get<uint8_t>();
    token.dex = parse_dex(entry.at("dex"));
    token.pool = entry.at("pool").get<std::string>();
    token.enabled = entry.value("enabled", true);
    return token;
}

MarketExpirySettings parse_expiry(const json& entry) {
    MarketExpirySettings expiry;
    expiry.market = entry.at("market").get<std::string>();
    expiry.expiry = entry.at("expiry").get<uint64_t>();
    expiry.can_unlist = entry.value("can_unlist", false);
    if (entry.contains("unlist_deposit_threshold")) {
        expiry.unlist_deposit_threshold = parse_amount(entry.at("unlist_deposit_threshold"), "unlist_deposit_threshold");
    }
    return expiry;
}

} // namespace

// =============================================================================
// Parsing
// =============================================================================

DeploymentConfig DeploymentConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();
    return from_json(std::string_view(content));
}

DeploymentConfig DeploymentConfig::from_json(std::string_view content) {
    json doc = json::parse(content.begin(), content.end(), nullptr, false);
    if (doc.is_discarded()) throw std::runtime_error("Malformed config: not valid JSON");
    return from_json(doc);
}

DeploymentConfig DeploymentConfig::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) throw std::runtime_error("Malformed config: top level must be an object");

    DeploymentConfig config;
    try {
        config.log_level = doc.value("log_level", config.log_level);
        Logger::parse_level(config.log_level);
        if (doc.contains("log_file")) config.log_file = doc.at("log_file").get<std::string>();

        if (doc.contains("swap_helper")) {
            const auto& swap = doc.at("swap_helper");
            if (swap.contains("backend_signer")) config.swap_backend_signer = swap.at("backend_signer").get<std::string>();
        }

        if (doc.contains("sentinel")) {
            const auto& sentinel = doc.at("sentinel");
            config.sentinel_keepers = sentinel.value("keepers", std::vector<std::string>{});
            if (sentinel.contains("tokens")) {
                for (const auto& entry : sentinel.at("tokens")) config.sentinel_tokens.push_back(parse_token(entry));
            }
        }

        if (doc.contains("undertaker")) {
            const auto& undertaker = doc.at("undertaker");
            if (undertaker.contains("global_deposit_threshold")) {
                config.global_deposit_threshold =
                    parse_amount(undertaker.at("global_deposit_threshold"), "global_deposit_threshold");
            }
            if (undertaker.contains("market_expiries")) {
                for (const auto& entry : undertaker.at("market_expiries")) {
                    config.market_expiries.push_back(parse_expiry(entry));
                }
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Malformed config: ") + e.what());
    }
    return config;
}

// =============================================================================
// Applying
// =============================================================================

void apply_logging(const DeploymentConfig& config) {
    LogLevel level = Logger::parse_level(config.log_level);
    if (config.log_file) {
        Logger::initialize_file(*config.log_file, level);
    } else {
        Logger::set_level(level);
    }
}

void apply_sentinel_config(const DeploymentConfig& config, Chain& chain, DeviationSentinel& sentinel,
                           const Address& governance) {
    chain.transact([&] {
        for (const auto& keeper : config.sentinel_keepers) {
            sentinel.set_trusted_keeper(governance, chain.resolve(keeper), true);
        }
        for (const auto& token : config.sentinel_tokens) {
            TokenConfig settings;
            settings.max_deviation_percent = token.max_deviation_percent;
            settings.dex = token.dex;
            settings.pool = chain.resolve(token.pool);
            settings.enabled = token.enabled;
            sentinel.set_token_config(governance, chain.resolve(token.asset), settings);
        }
    });
    Logger::info("config: {} keeper(s), {} sentinel token(s) applied",
                 config.sentinel_keepers.size(), config.sentinel_tokens.size());
}

void apply_undertaker_config(const DeploymentConfig& config, Chain& chain, Undertaker& undertaker,
                             const Address& governance) {
    chain.transact([&] {
        if (config.global_deposit_threshold) {
            undertaker.set_global_deposit_threshold(governance, *config.global_deposit_threshold);
        }
        for (const auto& expiry : config.market_expiries) {
            undertaker.set_market_expiry(governance, chain.resolve(expiry.market), expiry.expiry,
                                         expiry.can_unlist, expiry.unlist_deposit_threshold);
        }
    });
    Logger::info("config: {} market expiry(ies) applied", config.market_expiries.size());
}

} // namespace lever
