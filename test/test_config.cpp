// Deployment configuration parsing and application, logger behaviour

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <lever/config.hpp>
#include <lever/log.hpp>

#include "fixtures.hpp"

using namespace lever;
using lever::test::ether;
using lever::test::Protocol;
using lever::test::revert_code;

namespace {

const char* DEPLOYMENT = R"({
    "log_level": "info",
    "swap_helper": { "backend_signer": "backend" },
    "sentinel": {
        "keepers": ["keeper"],
        "tokens": [
            { "asset": "BTCB", "max_deviation_percent": 10, "dex": "reserve_ratio", "pool": "BTCB/USDT" },
            { "asset": "WBNB", "max_deviation_percent": 25, "dex": "uniswap", "pool": "WBNB/USDT",
              "enabled": false }
        ]
    },
    "undertaker": {
        "global_deposit_threshold": "1000000000000000000000",
        "market_expiries": [
            { "market": "vBTCB", "expiry": 1700086400, "can_unlist": true,
              "unlist_deposit_threshold": "500000000000000000000" }
        ]
    }
})";

std::filesystem::path temp_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / name;
}

} // namespace

TEST_CASE("Parse deployment config", "[config]") {
    SECTION("Full document") {
        DeploymentConfig config = DeploymentConfig::from_json(std::string_view(DEPLOYMENT));

        REQUIRE(config.log_level == "info");
        REQUIRE_FALSE(config.log_file.has_value());
        REQUIRE(config.swap_backend_signer == std::string("backend"));
        REQUIRE(config.sentinel_keepers == std::vector<std::string>{"keeper"});

        REQUIRE(config.sentinel_tokens.size() == 2);
        REQUIRE(config.sentinel_tokens[0].asset == "BTCB");
        REQUIRE(config.sentinel_tokens[0].max_deviation_percent == 10);
        REQUIRE(config.sentinel_tokens[0].dex == DexKind::RESERVE_RATIO);
        REQUIRE(config.sentinel_tokens[0].enabled);
        REQUIRE(config.sentinel_tokens[1].dex == DexKind::CONCENTRATED);
        REQUIRE_FALSE(config.sentinel_tokens[1].enabled);

        REQUIRE(config.global_deposit_threshold == ether(1000));
        REQUIRE(config.market_expiries.size() == 1);
        REQUIRE(config.market_expiries[0].market == "vBTCB");
        REQUIRE(config.market_expiries[0].expiry == 1700086400);
        REQUIRE(config.market_expiries[0].can_unlist);
        REQUIRE(config.market_expiries[0].unlist_deposit_threshold == ether(500));
    }

    SECTION("Defaults") {
        DeploymentConfig config = DeploymentConfig::from_json(std::string_view("{}"));
        REQUIRE(config.log_level == "warning");
        REQUIRE_FALSE(config.swap_backend_signer.has_value());
        REQUIRE(config.sentinel_keepers.empty());
        REQUIRE(config.sentinel_tokens.empty());
        REQUIRE_FALSE(config.global_deposit_threshold.has_value());
        REQUIRE(config.market_expiries.empty());
    }

    SECTION("Numeric amounts and exchange kinds") {
        DeploymentConfig config = DeploymentConfig::from_json(nlohmann::json::parse(R"({
            "sentinel": { "tokens": [{ "asset": "X", "max_deviation_percent": 5, "dex": 7, "pool": "P" }] },
            "undertaker": { "global_deposit_threshold": 42 }
        })"));
        REQUIRE(config.sentinel_tokens[0].dex == static_cast<DexKind>(7));
        REQUIRE(config.global_deposit_threshold == U256(42));
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(DeploymentConfig::from_json(std::string_view("{ not json")), std::runtime_error);
        REQUIRE_THROWS_AS(DeploymentConfig::from_json(std::string_view("[1, 2]")), std::runtime_error);
        REQUIRE_THROWS_AS(DeploymentConfig::from_json(std::string_view(R"({"log_level": "loud"})")),
                          std::runtime_error);
        REQUIRE_THROWS_AS(DeploymentConfig::from_json(std::string_view(R"({"log_level": 3})")), std::runtime_error);
        REQUIRE_THROWS_AS(DeploymentConfig::from_json(std::string_view(
                              R"({"sentinel": {"tokens": [{"asset": "X", "dex": "curve", "pool": "P",
                                                          "max_deviation_percent": 1}]}})")),
                          std::runtime_error);
        REQUIRE_THROWS_AS(DeploymentConfig::from_json(std::string_view(
                              R"({"sentinel": {"tokens": [{"asset": "X", "dex": "uniswap"}]}})")),
                          std::runtime_error);
        REQUIRE_THROWS_AS(DeploymentConfig::from_json(std::string_view(
                              R"({"undertaker": {"global_deposit_threshold": "12abc"}})")),
                          std::runtime_error);
        REQUIRE_THROWS_AS(DeploymentConfig::from_json(std::string_view(
                              R"({"undertaker": {"global_deposit_threshold": -1}})")),
                          std::runtime_error);
    }
}

TEST_CASE("Load deployment config from a file", "[config]") {
    REQUIRE_THROWS_AS(DeploymentConfig::from_file("/nonexistent/lever/deployment.json"), std::runtime_error);

    auto path = temp_path("lever_test_deployment.json");
    {
        std::ofstream out(path);
        out << DEPLOYMENT;
    }
    DeploymentConfig config = DeploymentConfig::from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(config.sentinel_tokens.size() == 2);
    REQUIRE(config.swap_backend_signer == std::string("backend"));
}

TEST_CASE("Apply deployment config", "[config]") {
    Protocol p;
    Address pair = p.pools.create_reserve_pool(p.btcb, p.usdt, ether(100), ether(200), "BTCB/USDT");
    Address v3_pool = p.pools.create_concentrated_pool(p.wbnb, p.usdt, dex_math::q96(), "WBNB/USDT");
    DeploymentConfig config = DeploymentConfig::from_json(std::string_view(DEPLOYMENT));

    SECTION("Sentinel") {
        apply_sentinel_config(config, p.chain, *p.sentinel, p.governance);

        REQUIRE(p.sentinel->is_trusted_keeper(p.keeper));
        auto btcb = p.sentinel->token_config(p.btcb);
        REQUIRE(btcb.has_value());
        REQUIRE(btcb->pool == pair);
        REQUIRE(btcb->dex == DexKind::RESERVE_RATIO);
        REQUIRE(btcb->enabled);
        REQUIRE(p.sentinel->token_config(p.wbnb)->pool == v3_pool);

        // Configured market is immediately monitorable
        p.pools.set_reserves(pair, ether(100), ether(300));
        p.sentinel->handle_deviation(p.keeper, p.v_btcb);
        REQUIRE(p.comptroller.action_paused(p.v_btcb, Action::BORROW));
    }

    SECTION("Sentinel config is all or nothing") {
        REQUIRE(revert_code([&] { apply_sentinel_config(config, p.chain, *p.sentinel, p.alice); }) ==
                ErrorCode::Unauthorized);

        config.sentinel_tokens[1].pool = "missing-pool";
        REQUIRE_THROWS_AS(apply_sentinel_config(config, p.chain, *p.sentinel, p.governance), std::invalid_argument);
        REQUIRE_FALSE(p.sentinel->is_trusted_keeper(p.keeper));
        REQUIRE_FALSE(p.sentinel->token_config(p.btcb).has_value());
    }

    SECTION("Undertaker") {
        apply_undertaker_config(config, p.chain, *p.undertaker, p.governance);

        REQUIRE(p.undertaker->global_deposit_threshold() == ether(1000));
        MarketExpiry expiry = p.undertaker->market_expiry(p.v_btcb);
        REQUIRE(expiry.expiry == 1700086400);
        REQUIRE(expiry.can_unlist);
        REQUIRE(expiry.unlist_deposit_threshold == ether(500));
    }

    SECTION("Undertaker config is all or nothing") {
        // A token, not a market
        config.market_expiries.push_back(MarketExpirySettings{"USDT", 1, false, 0});
        REQUIRE(revert_code([&] { apply_undertaker_config(config, p.chain, *p.undertaker, p.governance); }) ==
                ErrorCode::MarketNotListed);
        REQUIRE(p.undertaker->global_deposit_threshold() == 0);
    }

    SECTION("Swap helper signer from config") {
        SwapHelper helper(p.chain, p.tokens, p.chain.resolve(*config.swap_backend_signer));
        REQUIRE(helper.backend_signer() == p.backend);
    }
}

TEST_CASE("Logger", "[log]") {
    std::ostringstream captured;
    Logger::initialize(LogLevel::INFO, &captured);

    SECTION("Level filtering") {
        Logger::debug("hidden {}", 1);
        Logger::info("shown {}", 2);
        Logger::warning("also {}", "shown");

        std::string out = captured.str();
        REQUIRE(out.find("hidden") == std::string::npos);
        REQUIRE(out.find("[INFO]") != std::string::npos);
        REQUIRE(out.find("shown 2") != std::string::npos);
        REQUIRE(out.find("[WARN] ") != std::string::npos);
        REQUIRE(out.find("also shown") != std::string::npos);

        Logger::set_level(LogLevel::OFF);
        Logger::error("silenced");
        REQUIRE(captured.str().find("silenced") == std::string::npos);
    }

    SECTION("Level names") {
        REQUIRE(Logger::parse_level("warn") == LogLevel::WARNING);
        REQUIRE(Logger::parse_level("off") == LogLevel::OFF);
        REQUIRE_THROWS_AS(Logger::parse_level("verbose"), std::invalid_argument);
        REQUIRE(std::string(Logger::level_name(LogLevel::ERROR)) == "ERROR");
    }

    SECTION("Configured log file") {
        auto path = temp_path("lever_test.log");
        std::filesystem::remove(path);

        DeploymentConfig config;
        config.log_level = "debug";
        config.log_file = path.string();
        apply_logging(config);
        REQUIRE(Logger::level() == LogLevel::DEBUG);
        Logger::debug("to file");

        Logger::initialize(LogLevel::WARNING);
        std::ifstream in(path);
        std::stringstream contents;
        contents << in.rdbuf();
        REQUIRE(contents.str().find("[DEBUG]") != std::string::npos);
        REQUIRE(contents.str().find("to file") != std::string::npos);
        std::filesystem::remove(path);
    }

    SECTION("Level only") {
        DeploymentConfig config;
        config.log_level = "error";
        apply_logging(config);
        REQUIRE(Logger::level() == LogLevel::ERROR);
    }

    Logger::initialize(LogLevel::WARNING);
}
