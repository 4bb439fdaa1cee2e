// Simulated lending market: accounting, risk checks, flash loans, governance

#include <catch2/catch.hpp>

#include <stdexcept>

#include "fixtures.hpp"

using namespace lever;
using lever::test::ether;
using lever::test::Protocol;
using lever::test::revert_code;

namespace {

// Flash-loan receiver returning a fixed share of what it owes
class ScriptedReceiver : public IFlashLoanReceiver {
public:
    ScriptedReceiver(Chain& chain, TokenLedger& tokens)
        : tokens_(tokens), self_(chain.create_address("ScriptedReceiver")) {}

    Address address() const override { return self_; }

    std::vector<U256> execute_operation(const Address& caller, const std::vector<Address>& markets,
                                        const std::vector<U256>& amounts, const std::vector<U256>& premiums,
                                        const Address& initiator, const Address& on_behalf,
                                        const Bytes& data) override {
        calls++;
        last_caller = caller;
        last_initiator = initiator;
        last_on_behalf = on_behalf;
        last_premium = premiums.at(0);
        received = tokens_.balance_of(underlying, self_);

        U256 owed = amounts.at(0) + premiums.at(0);
        U256 repayment = repay_all ? owed : repay;
        tokens_.approve(self_, underlying, markets.at(0), repayment);
        (void)data;
        return {repayment};
    }

    Address underlying;
    bool repay_all = true;
    U256 repay;

    int calls = 0;
    Address last_caller;
    Address last_initiator;
    Address last_on_behalf;
    U256 last_premium;
    U256 received;

private:
    TokenLedger& tokens_;
    Address self_;
};

} // namespace

TEST_CASE("Supplying and redeeming", "[comptroller]") {
    Protocol p;

    REQUIRE(p.comptroller.is_listed(p.v_usdt));
    REQUIRE(p.comptroller.underlying(p.v_usdt) == p.usdt);
    REQUIRE(p.comptroller.all_markets().size() == 3);
    REQUIRE(p.comptroller.is_native_market(p.v_bnb));
    REQUIRE_FALSE(p.comptroller.is_native_market(p.v_usdt));
    REQUIRE(p.comptroller.exchange_rate_stored(p.v_usdt) == EXP_SCALE);

    p.tokens.approve(p.alice, p.usdt, p.v_usdt, MAX_U256);

    SECTION("Mint credits shares at the exchange rate") {
        REQUIRE(p.comptroller.mint(p.alice, p.v_usdt, ether(100)) == market_errors::OK);
        REQUIRE(p.comptroller.balance_of(p.v_usdt, p.alice) == ether(100));
        REQUIRE(p.collateral_of(p.v_usdt, p.alice) == ether(100));
        REQUIRE(p.comptroller.get_cash(p.v_usdt) == ether(100100));
        REQUIRE(p.chain.events(p.v_usdt, "Mint").size() == 2);
    }

    SECTION("Redeem pays the treasury fee") {
        p.comptroller.set_treasury_data(p.governance, p.treasury, amounts::parse_units("0.01", 18));
        p.comptroller.mint(p.alice, p.v_usdt, ether(100));

        U256 before = p.tokens.balance_of(p.usdt, p.alice);
        REQUIRE(p.comptroller.redeem_underlying(p.alice, p.v_usdt, ether(50)) == market_errors::OK);
        REQUIRE(p.tokens.balance_of(p.usdt, p.treasury) == amounts::parse_units("0.5", 18));
        REQUIRE(p.tokens.balance_of(p.usdt, p.alice) - before == amounts::parse_units("49.5", 18));
        REQUIRE(p.collateral_of(p.v_usdt, p.alice) == ether(50));
    }

    SECTION("Redeeming more than supplied fails with a code") {
        p.comptroller.mint(p.alice, p.v_usdt, ether(10));
        REQUIRE(p.comptroller.redeem_underlying(p.alice, p.v_usdt, ether(11)) == market_errors::INSUFFICIENT_BALANCE);
    }

    SECTION("Paused mint and supply cap") {
        p.comptroller.set_actions_paused(p.governance, {p.v_usdt}, {Action::MINT}, true);
        REQUIRE(p.comptroller.action_paused(p.v_usdt, Action::MINT));
        REQUIRE(p.comptroller.mint(p.alice, p.v_usdt, ether(1)) == market_errors::ACTION_PAUSED);

        p.comptroller.set_actions_paused(p.governance, {p.v_usdt}, {Action::MINT}, false);
        p.comptroller.set_market_supply_caps(p.governance, {p.v_usdt}, {ether(100050)});
        REQUIRE(p.comptroller.mint(p.alice, p.v_usdt, ether(51)) == market_errors::SUPPLY_CAP_REACHED);
        REQUIRE(p.comptroller.mint(p.alice, p.v_usdt, ether(50)) == market_errors::OK);
    }

    SECTION("Unlisted market") {
        Address unknown = p.chain.create_address("vNOPE");
        REQUIRE_FALSE(p.comptroller.is_listed(unknown));
        REQUIRE(p.comptroller.mint(p.alice, unknown, ether(1)) == market_errors::MARKET_NOT_LISTED);
    }
}

TEST_CASE("Borrowing against collateral", "[comptroller]") {
    Protocol p;
    p.tokens.approve(p.alice, p.btcb, p.v_btcb, MAX_U256);
    p.tokens.approve(p.alice, p.usdt, p.v_usdt, MAX_U256);
    p.comptroller.mint(p.alice, p.v_btcb, ether(100));   // $200, CF 0.8 -> $160
    p.comptroller.enter_markets(p.alice, {p.v_btcb});

    REQUIRE(p.comptroller.assets_in(p.alice) == std::vector<Address>{p.v_btcb});
    REQUIRE(p.comptroller.get_account_liquidity(p.alice).liquidity == ether(160));

    SECTION("Borrow within liquidity") {
        U256 before = p.tokens.balance_of(p.usdt, p.alice);
        REQUIRE(p.comptroller.borrow(p.alice, p.v_usdt, ether(100)) == market_errors::OK);
        REQUIRE(p.tokens.balance_of(p.usdt, p.alice) - before == ether(100));
        REQUIRE(p.debt_of(p.v_usdt, p.alice) == ether(100));

        AccountLiquidity liquidity = p.comptroller.get_account_liquidity(p.alice);
        REQUIRE(liquidity.error == market_errors::OK);
        REQUIRE(liquidity.liquidity == ether(60));
        REQUIRE(liquidity.shortfall == 0);
    }

    SECTION("Borrow beyond liquidity fails") {
        REQUIRE(p.comptroller.borrow(p.alice, p.v_usdt, ether(161)) == market_errors::INSUFFICIENT_LIQUIDITY);
        REQUIRE(p.debt_of(p.v_usdt, p.alice) == 0);
    }

    SECTION("Borrow cap, pause and pool flag") {
        p.comptroller.set_market_borrow_caps(p.governance, {p.v_usdt}, {ether(10)});
        REQUIRE(p.comptroller.borrow(p.alice, p.v_usdt, ether(11)) == market_errors::BORROW_CAP_REACHED);

        p.comptroller.set_actions_paused(p.governance, {p.v_usdt}, {Action::BORROW}, true);
        REQUIRE(p.comptroller.borrow(p.alice, p.v_usdt, ether(1)) == market_errors::ACTION_PAUSED);

        p.comptroller.set_actions_paused(p.governance, {p.v_usdt}, {Action::BORROW}, false);
        p.comptroller.set_is_borrow_allowed(p.governance, 0, p.v_usdt, false);
        REQUIRE(p.comptroller.borrow(p.alice, p.v_usdt, ether(1)) == market_errors::BORROW_NOT_ALLOWED);
    }

    SECTION("Missing price is reported as an error code") {
        p.oracle.set_price(p.btcb, 0);
        REQUIRE(p.comptroller.get_account_liquidity(p.alice).error == market_errors::PRICE_ERROR);
        REQUIRE(p.comptroller.borrow(p.alice, p.v_usdt, ether(1)) == market_errors::PRICE_ERROR);
    }

    SECTION("Redeem that would leave a shortfall fails") {
        p.comptroller.borrow(p.alice, p.v_usdt, ether(150));
        REQUIRE(p.comptroller.redeem_underlying(p.alice, p.v_btcb, ether(10)) ==
                market_errors::INSUFFICIENT_LIQUIDITY);
    }

    SECTION("Repay") {
        p.comptroller.borrow(p.alice, p.v_usdt, ether(100));
        REQUIRE(p.comptroller.repay_borrow(p.alice, p.v_usdt, ether(101)) == market_errors::TOO_MUCH_REPAY);
        REQUIRE(p.comptroller.repay_borrow(p.alice, p.v_usdt, ether(40)) == market_errors::OK);
        REQUIRE(p.debt_of(p.v_usdt, p.alice) == ether(60));
        REQUIRE(p.comptroller.repay_borrow(p.alice, p.v_usdt, MAX_U256) == market_errors::OK);
        REQUIRE(p.debt_of(p.v_usdt, p.alice) == 0);
    }

    SECTION("Interest accrues per second") {
        p.comptroller.set_borrow_rate(p.governance, p.v_usdt, U256(10000000000ULL));  // 1e-8 per second
        p.comptroller.borrow(p.alice, p.v_usdt, ether(100));
        p.chain.advance_time(1000);

        // 100 * (1 + 1e-8 * 1000)
        REQUIRE(p.debt_of(p.v_usdt, p.alice) == ether(100) + amounts::parse_units("0.001", 18));
        REQUIRE(p.comptroller.borrow_balance_stored(p.v_usdt, p.alice) ==
                ether(100) + amounts::parse_units("0.001", 18));
        REQUIRE(p.comptroller.total_borrows(p.v_usdt) == ether(100) + amounts::parse_units("0.001", 18));
        REQUIRE(p.chain.events(p.v_usdt, "AccrueInterest").size() == 1);
    }
}

TEST_CASE("Acting on behalf of an account", "[comptroller]") {
    Protocol p;
    Address delegate = p.chain.create_address("delegate");
    p.tokens.mint(p.btcb, delegate, ether(100));
    p.tokens.approve(delegate, p.btcb, p.v_btcb, MAX_U256);

    // Anyone may supply for someone else
    REQUIRE(p.comptroller.mint_behalf(delegate, p.alice, p.v_btcb, ether(100)) == market_errors::OK);
    REQUIRE(p.collateral_of(p.v_btcb, p.alice) == ether(100));

    SECTION("Borrowing and redeeming need an approved delegate") {
        REQUIRE(p.comptroller.enter_market_behalf(delegate, p.alice, p.v_btcb) ==
                market_errors::DELEGATE_NOT_APPROVED);
        REQUIRE(p.comptroller.borrow_behalf(delegate, p.alice, p.v_usdt, ether(1)) ==
                market_errors::DELEGATE_NOT_APPROVED);
        REQUIRE(p.comptroller.redeem_underlying_behalf(delegate, p.alice, p.v_btcb, ether(1)) ==
                market_errors::DELEGATE_NOT_APPROVED);
    }

    SECTION("Approved delegate receives the borrowed funds") {
        p.comptroller.update_delegate(p.alice, delegate, true);
        REQUIRE(p.comptroller.approved_delegates(p.alice, delegate));

        REQUIRE(p.comptroller.enter_market_behalf(delegate, p.alice, p.v_btcb) == market_errors::OK);
        REQUIRE(p.comptroller.borrow_behalf(delegate, p.alice, p.v_usdt, ether(10)) == market_errors::OK);
        REQUIRE(p.tokens.balance_of(p.usdt, delegate) == ether(10));
        REQUIRE(p.debt_of(p.v_usdt, p.alice) == ether(10));

        p.comptroller.update_delegate(p.alice, delegate, false);
        REQUIRE_FALSE(p.comptroller.approved_delegates(p.alice, delegate));
    }

    SECTION("Redeeming by share amount") {
        p.comptroller.update_delegate(p.alice, delegate, true);
        REQUIRE(p.comptroller.redeem_behalf(delegate, p.alice, p.v_btcb, ether(40)) == market_errors::OK);
        REQUIRE(p.comptroller.balance_of(p.v_btcb, p.alice) == ether(60));
        REQUIRE(p.tokens.balance_of(p.btcb, delegate) == ether(40));
        REQUIRE(p.comptroller.redeem_behalf(delegate, p.alice, p.v_btcb, ether(61)) ==
                market_errors::INSUFFICIENT_BALANCE);
    }

    SECTION("Seizing needs a whitelisted executor") {
        REQUIRE(p.comptroller.seize(delegate, p.v_btcb, p.alice, delegate, ether(10)) == market_errors::UNAUTHORIZED);

        p.comptroller.set_whitelisted_executor(p.governance, delegate, true);
        REQUIRE(p.comptroller.is_whitelisted_executor(delegate));
        REQUIRE(p.comptroller.seize(delegate, p.v_btcb, p.alice, p.alice, ether(10)) == market_errors::REJECTION);
        REQUIRE(p.comptroller.seize(delegate, p.v_btcb, p.alice, delegate, ether(101)) ==
                market_errors::INSUFFICIENT_BALANCE);

        // Shares change hands, supply is unchanged
        REQUIRE(p.comptroller.seize(delegate, p.v_btcb, p.alice, delegate, ether(10)) == market_errors::OK);
        REQUIRE(p.comptroller.balance_of(p.v_btcb, p.alice) == ether(90));
        REQUIRE(p.comptroller.balance_of(p.v_btcb, delegate) == ether(10));
        REQUIRE(p.comptroller.total_supply(p.v_btcb) == ether(100100));

        REQUIRE_THROWS_AS(p.comptroller.set_whitelisted_executor(p.alice, delegate, false), ContractError);
    }
}

TEST_CASE("Flash loans", "[comptroller][flashloan]") {
    Protocol p;
    ScriptedReceiver receiver(p.chain, p.tokens);
    receiver.underlying = p.usdt;
    Address operator_account = p.chain.create_address("operator");

    SECTION("Caller must be whitelisted") {
        REQUIRE(revert_code([&] {
                    p.comptroller.execute_flash_loan(operator_account, operator_account, receiver, {p.v_usdt},
                                                     {ether(1)}, {});
                }) == ErrorCode::Unauthorized);
    }

    p.comptroller.set_whitelisted_flash_loan_account(p.governance, operator_account, true);
    REQUIRE(p.comptroller.is_flash_loan_whitelisted(operator_account));

    SECTION("Full repayment with premium to reserves") {
        MarketConfig config;
        config.underlying = p.usdt;
        config.symbol = "vUSDT_FEE";
        config.flash_loan_fee = amounts::parse_units("0.001", 18);
        Address market = p.comptroller.support_market(p.governance, config);
        p.tokens.mint(p.usdt, market, ether(1000));
        p.tokens.mint(p.usdt, receiver.address(), ether(1));

        p.comptroller.execute_flash_loan(operator_account, operator_account, receiver, {market}, {ether(100)}, {});

        REQUIRE(receiver.calls == 1);
        REQUIRE(receiver.last_caller == p.comptroller.address());
        REQUIRE(receiver.last_initiator == operator_account);
        REQUIRE(receiver.received == ether(101));
        REQUIRE(receiver.last_premium == amounts::parse_units("0.1", 18));
        REQUIRE(p.comptroller.get_cash(market) == ether(1000) + amounts::parse_units("0.1", 18));
        REQUIRE(p.comptroller.total_reserves(market) == amounts::parse_units("0.1", 18));
        REQUIRE(p.chain.events(p.comptroller.address(), "FlashLoanExecuted").size() == 1);
    }

    SECTION("Unpaid amount becomes debt of on_behalf") {
        p.tokens.approve(p.alice, p.btcb, p.v_btcb, MAX_U256);
        p.comptroller.mint(p.alice, p.v_btcb, ether(100));
        p.comptroller.enter_markets(p.alice, {p.v_btcb});
        p.comptroller.update_delegate(p.alice, operator_account, true);

        receiver.repay_all = false;
        receiver.repay = ether(30);
        p.comptroller.execute_flash_loan(operator_account, p.alice, receiver, {p.v_usdt}, {ether(100)}, {});

        REQUIRE(receiver.last_on_behalf == p.alice);
        REQUIRE(p.debt_of(p.v_usdt, p.alice) == ether(70));
        REQUIRE(p.tokens.balance_of(p.usdt, receiver.address()) == ether(70));
        REQUIRE(p.comptroller.exchange_rate_stored(p.v_usdt) == EXP_SCALE);
    }

    SECTION("Unpaid amount without liquidity reverts everything") {
        receiver.repay_all = false;
        receiver.repay = 0;
        REQUIRE(revert_code([&] {
                    p.comptroller.execute_flash_loan(operator_account, operator_account, receiver, {p.v_usdt},
                                                     {ether(100)}, {});
                }) == ErrorCode::InsufficientRepayment);
        REQUIRE(p.tokens.balance_of(p.usdt, receiver.address()) == 0);
        REQUIRE(p.comptroller.get_cash(p.v_usdt) == ether(100000));
    }

    SECTION("on_behalf must have approved the caller") {
        REQUIRE(revert_code([&] {
                    p.comptroller.execute_flash_loan(operator_account, p.alice, receiver, {p.v_usdt}, {ether(1)}, {});
                }) == ErrorCode::NotAnApprovedDelegate);
    }

    SECTION("Argument validation") {
        REQUIRE(revert_code([&] {
                    p.comptroller.execute_flash_loan(operator_account, operator_account, receiver, {p.v_usdt},
                                                     {ether(1), ether(2)}, {});
                }) == ErrorCode::FlashLoanAssetOrAmountMismatch);
        REQUIRE(revert_code([&] {
                    p.comptroller.execute_flash_loan(operator_account, operator_account, receiver, {p.v_usdt}, {U256(0)},
                                                     {});
                }) == ErrorCode::ZeroAmount);

        MarketConfig config;
        config.underlying = p.usdt;
        config.symbol = "vUSDT_NOFLASH";
        config.flash_loan_enabled = false;
        Address market = p.comptroller.support_market(p.governance, config);
        REQUIRE(revert_code([&] {
                    p.comptroller.execute_flash_loan(operator_account, operator_account, receiver, {market},
                                                     {ether(1)}, {});
                }) == ErrorCode::FlashLoanNotEnabled);
    }
}

TEST_CASE("Risk parameter governance", "[comptroller][governance]") {
    Protocol p;

    SECTION("Setters are access controlled") {
        REQUIRE(revert_code([&] {
                    p.comptroller.set_collateral_factor(p.alice, 0, p.v_usdt, 0, 0);
                }) == ErrorCode::Unauthorized);
        REQUIRE(revert_code([&] {
                    p.comptroller.set_actions_paused(p.alice, {p.v_usdt}, {Action::BORROW}, true);
                }) == ErrorCode::Unauthorized);
    }

    SECTION("Collateral factor bounds") {
        REQUIRE(revert_code([&] {
                    p.comptroller.set_collateral_factor(p.governance, 0, p.v_usdt, ether(1) / 2, ether(1) / 4);
                }) == ErrorCode::InvalidCollateralFactor);
        REQUIRE(revert_code([&] {
                    p.comptroller.set_collateral_factor(p.governance, 0, p.v_usdt, ether(1) / 2, ether(2));
                }) == ErrorCode::InvalidCollateralFactor);

        p.comptroller.set_collateral_factor(p.governance, 0, p.v_usdt, ether(1) / 2, ether(1) * 3 / 4);
        PoolMarket entry = p.comptroller.pool_market(0, p.v_usdt);
        REQUIRE(entry.collateral_factor == ether(1) / 2);
        REQUIRE(entry.liquidation_threshold == ether(1) * 3 / 4);
    }

    SECTION("Core pools") {
        REQUIRE(p.comptroller.topology() == PoolTopology::CORE);
        uint32_t pool = p.comptroller.add_pool(p.governance, "stablecoins");
        REQUIRE(pool == 1);
        REQUIRE(p.comptroller.last_pool_id() == 1);

        REQUIRE_FALSE(p.comptroller.pool_market(pool, p.v_usdt).listed);
        REQUIRE(revert_code([&] {
                    p.comptroller.set_collateral_factor(p.governance, pool, p.v_usdt, 0, 0);
                }) == ErrorCode::MarketNotListed);

        p.comptroller.add_pool_market(p.governance, pool, p.v_usdt);
        p.comptroller.set_collateral_factor(p.governance, pool, p.v_usdt, ether(1) * 9 / 10, ether(1) * 9 / 10);
        REQUIRE(p.comptroller.pool_market(pool, p.v_usdt).collateral_factor == ether(1) * 9 / 10);
        REQUIRE(p.comptroller.pool_market(0, p.v_usdt).collateral_factor == ether(1) * 8 / 10);

        REQUIRE_THROWS_AS(p.comptroller.add_pool_market(p.governance, 7, p.v_usdt), std::invalid_argument);
    }

    SECTION("Isolated comptroller has a single pool") {
        Protocol isolated(PoolTopology::ISOLATED);
        REQUIRE_THROWS_AS(isolated.comptroller.add_pool(isolated.governance, "extra"), std::logic_error);
        REQUIRE_THROWS_AS(isolated.comptroller.set_collateral_factor(isolated.governance, 1, isolated.v_usdt, 0, 0),
                          std::invalid_argument);
    }

    SECTION("Cap lists must match") {
        REQUIRE_THROWS_AS(p.comptroller.set_market_supply_caps(p.governance, {p.v_usdt}, {}), std::invalid_argument);
    }

    SECTION("Unlisting requires a fully wound down market") {
        REQUIRE(p.comptroller.unlist_market(p.governance, p.v_btcb) == market_errors::REJECTION);

        p.comptroller.set_actions_paused(p.governance, {p.v_btcb},
                                         {Action::MINT, Action::BORROW, Action::ENTER_MARKET}, true);
        p.comptroller.set_market_supply_caps(p.governance, {p.v_btcb}, {0});
        p.comptroller.set_market_borrow_caps(p.governance, {p.v_btcb}, {0});
        REQUIRE(p.comptroller.unlist_market(p.governance, p.v_btcb) == market_errors::REJECTION);

        p.comptroller.set_collateral_factor(p.governance, 0, p.v_btcb, 0, ether(1) * 8 / 10);
        REQUIRE(p.comptroller.unlist_market(p.governance, p.v_btcb) == market_errors::OK);
        REQUIRE_FALSE(p.comptroller.is_listed(p.v_btcb));
        REQUIRE(p.comptroller.unlist_market(p.governance, p.v_btcb) == market_errors::MARKET_NOT_LISTED);
    }
}
