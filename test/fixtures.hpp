// Shared protocol deployment for the test suite

#ifndef LEVER_TEST_FIXTURES_HPP
#define LEVER_TEST_FIXTURES_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <lever/access.hpp>
#include <lever/chain.hpp>
#include <lever/comptroller.hpp>
#include <lever/dex.hpp>
#include <lever/error.hpp>
#include <lever/leverage.hpp>
#include <lever/oracle.hpp>
#include <lever/sentinel.hpp>
#include <lever/swap_helper.hpp>
#include <lever/token.hpp>
#include <lever/undertaker.hpp>

namespace lever::test {

inline U256 ether(uint64_t whole) { return amounts::units(whole, 18); }

// Revert code of fn, or nullopt when it did not revert with a ContractError
template <typename Fn>
std::optional<ErrorCode> revert_code(Fn&& fn) {
    try {
        fn();
    } catch (const ContractError& e) {
        return e.code();
    }
    return std::nullopt;
}

// =============================================================================
// Protocol
//
// Tokens USDT ($1), BTCB ($2), WBNB ($1), all 18 decimals, each with a market
// (vBNB is the native one) holding 100,000 tokens of lender liquidity.
// "alice" holds 1,000 of each token, approved the manager for all of them and
// made it her delegate. Governance may call every access controlled function.
// =============================================================================

struct Protocol {
    Chain chain;
    TokenLedger tokens{chain};
    Address governance = chain.create_address("governance");
    Address alice = chain.create_address("alice");
    Address bob = chain.create_address("bob");
    Address lender = chain.create_address("lender");
    Address keeper = chain.create_address("keeper");
    Address backend = chain.create_address("backend");
    Address treasury = chain.create_address("treasury");
    Address reserve = chain.create_address("ProtocolShareReserve");

    AccessControlManager acm{chain, governance};
    FixedPriceOracle oracle{chain};
    SimulatedComptroller comptroller;
    SwapHelper swap_helper{chain, tokens, backend};
    DexPoolRegistry pools{chain};

    Address usdt;
    Address btcb;
    Address wbnb;
    Address v_usdt;
    Address v_btcb;
    Address v_bnb;

    std::unique_ptr<LeverageStrategiesManager> manager;
    std::unique_ptr<DeviationSentinel> sentinel;
    std::unique_ptr<Undertaker> undertaker;

    explicit Protocol(PoolTopology topology = PoolTopology::CORE)
        : comptroller(chain, tokens, acm, oracle, topology) {
        for (const auto* signature :
             {&signatures::SUPPORT_MARKET, &signatures::SET_ACTIONS_PAUSED, &signatures::SET_COLLATERAL_FACTOR,
              &signatures::SET_SUPPLY_CAPS, &signatures::SET_BORROW_CAPS, &signatures::UNLIST_MARKET,
              &signatures::CREATE_POOL, &signatures::ADD_POOL_MARKET, &signatures::SET_IS_BORROW_ALLOWED,
              &signatures::SET_TREASURY_DATA, &signatures::SET_PROTOCOL_SHARE_RESERVE,
              &signatures::SET_FLASH_LOAN_WHITELIST, &signatures::SET_BORROW_RATE,
              &signatures::SET_WHITELISTED_EXECUTOR,
              &DeviationSentinel::SET_TOKEN_CONFIG, &DeviationSentinel::SET_TRUSTED_KEEPER,
              &Undertaker::SET_GLOBAL_DEPOSIT_THRESHOLD, &Undertaker::SET_MARKET_EXPIRY}) {
            acm.give_call_permission(governance, ZERO_ADDRESS, *signature, governance);
        }

        usdt = tokens.create_token("USDT", 18);
        btcb = tokens.create_token("BTCB", 18);
        wbnb = tokens.create_token("WBNB", 18);

        v_usdt = list_market(usdt, "vUSDT", ether(1), amounts::parse_units("0.8", 18));
        v_btcb = list_market(btcb, "vBTCB", ether(2), amounts::parse_units("0.8", 18));
        v_bnb = list_market(wbnb, "vBNB", ether(1), amounts::parse_units("0.8", 18), true);

        comptroller.set_treasury_data(governance, treasury, 0);
        comptroller.set_protocol_share_reserve(governance, reserve);

        for (const auto& token : {usdt, btcb, wbnb}) {
            tokens.mint(token, alice, ether(1000));
            tokens.mint(token, bob, ether(1000));
            tokens.mint(token, swap_helper.address(), ether(1000000));
        }

        manager = std::make_unique<LeverageStrategiesManager>(chain, tokens, comptroller, swap_helper, v_bnb, reserve);
        authorize(*manager, alice);

        sentinel = std::make_unique<DeviationSentinel>(chain, acm, comptroller, oracle, pools);
        undertaker = std::make_unique<Undertaker>(chain, acm, comptroller, oracle);
        for (const auto* signature : {&signatures::SET_ACTIONS_PAUSED, &signatures::SET_COLLATERAL_FACTOR}) {
            acm.give_call_permission(governance, comptroller.address(), *signature, sentinel->address());
        }
        for (const auto* signature :
             {&signatures::SET_ACTIONS_PAUSED, &signatures::SET_COLLATERAL_FACTOR, &signatures::SET_SUPPLY_CAPS,
              &signatures::SET_BORROW_CAPS, &signatures::UNLIST_MARKET}) {
            acm.give_call_permission(governance, comptroller.address(), *signature, undertaker->address());
        }
    }

    // Lists a market with collateral factor == liquidation threshold == cf and
    // supplies lender liquidity
    Address list_market(const Address& token, const std::string& symbol, const U256& price, const U256& cf,
                        bool native = false, const U256& flash_loan_fee = U256(0)) {
        MarketConfig config;
        config.underlying = token;
        config.symbol = symbol;
        config.native = native;
        config.flash_loan_fee = flash_loan_fee;
        Address market = comptroller.support_market(governance, config);

        oracle.set_market_underlying(market, token);
        oracle.set_price(token, price);
        comptroller.set_collateral_factor(governance, 0, market, cf, cf);

        tokens.mint(token, lender, ether(100000));
        tokens.approve(lender, token, market, MAX_U256);
        comptroller.mint(lender, market, ether(100000));
        return market;
    }

    // Whitelists a manager for flash loans and lets `user` use it
    void authorize(const LeverageStrategiesManager& target, const Address& user) {
        comptroller.set_whitelisted_flash_loan_account(governance, target.address(), true);
        comptroller.update_delegate(user, target.address(), true);
        for (const auto& token : {usdt, btcb, wbnb}) {
            tokens.approve(user, token, target.address(), MAX_U256);
        }
    }

    // Converter batch: consume amount_in of token_in, pay amount_out of
    // token_out to the manager (or to `to`)
    SwapInstructions exchange(const Address& token_in, const U256& amount_in, const Address& token_out,
                              const U256& amount_out, std::optional<Address> to = std::nullopt) const {
        SwapInstructions instructions;
        instructions.calls.push_back(
            ExchangeCall{token_in, amount_in, token_out, amount_out, to.value_or(manager->address())});
        return instructions;
    }

    U256 collateral_of(const Address& market, const Address& account) {
        return comptroller.balance_of_underlying(market, account);
    }

    U256 debt_of(const Address& market, const Address& account) {
        return comptroller.borrow_balance_current(market, account);
    }
};

// =============================================================================
// ForwardingMarketService - decorator over a real market service; tests
// override single methods to misbehave
// =============================================================================

class ForwardingMarketService : public IMarketService {
public:
    explicit ForwardingMarketService(IMarketService& inner) : inner_(inner) {}

    Address address() const override { return inner_.address(); }
    bool is_listed(const Address& m) const override { return inner_.is_listed(m); }
    Address underlying(const Address& m) const override { return inner_.underlying(m); }
    std::vector<Address> all_markets() const override { return inner_.all_markets(); }
    PoolTopology topology() const override { return inner_.topology(); }
    uint32_t last_pool_id() const override { return inner_.last_pool_id(); }
    PoolMarket pool_market(uint32_t id, const Address& m) const override { return inner_.pool_market(id, m); }
    bool action_paused(const Address& m, Action a) const override { return inner_.action_paused(m, a); }
    U256 treasury_percent() const override { return inner_.treasury_percent(); }
    Address protocol_share_reserve() const override { return inner_.protocol_share_reserve(); }

    bool approved_delegates(const Address& a, const Address& d) const override {
        return inner_.approved_delegates(a, d);
    }
    std::vector<Address> assets_in(const Address& a) const override { return inner_.assets_in(a); }

    uint32_t mint_behalf(const Address& c, const Address& a, const Address& m, const U256& x) override {
        return inner_.mint_behalf(c, a, m, x);
    }
    uint32_t enter_market_behalf(const Address& c, const Address& a, const Address& m) override {
        return inner_.enter_market_behalf(c, a, m);
    }
    uint32_t borrow_behalf(const Address& c, const Address& a, const Address& m, const U256& x) override {
        return inner_.borrow_behalf(c, a, m, x);
    }
    uint32_t repay_borrow_behalf(const Address& c, const Address& a, const Address& m, const U256& x) override {
        return inner_.repay_borrow_behalf(c, a, m, x);
    }
    uint32_t redeem_underlying_behalf(const Address& c, const Address& a, const Address& m, const U256& x) override {
        return inner_.redeem_underlying_behalf(c, a, m, x);
    }
    uint32_t redeem_behalf(const Address& c, const Address& a, const Address& m, const U256& x) override {
        return inner_.redeem_behalf(c, a, m, x);
    }
    uint32_t seize(const Address& c, const Address& m, const Address& b, const Address& r, const U256& x) override {
        return inner_.seize(c, m, b, r, x);
    }
    uint32_t accrue_interest(const Address& m) override { return inner_.accrue_interest(m); }

    U256 borrow_balance_current(const Address& m, const Address& a) override {
        return inner_.borrow_balance_current(m, a);
    }
    U256 borrow_balance_stored(const Address& m, const Address& a) const override {
        return inner_.borrow_balance_stored(m, a);
    }
    U256 balance_of_underlying(const Address& m, const Address& a) override {
        return inner_.balance_of_underlying(m, a);
    }
    U256 exchange_rate_stored(const Address& m) const override { return inner_.exchange_rate_stored(m); }
    U256 balance_of(const Address& m, const Address& a) const override { return inner_.balance_of(m, a); }
    U256 total_supply(const Address& m) const override { return inner_.total_supply(m); }
    AccountLiquidity get_account_liquidity(const Address& a) const override { return inner_.get_account_liquidity(a); }

    void execute_flash_loan(const Address& caller, const Address& on_behalf, IFlashLoanReceiver& receiver,
                            const std::vector<Address>& markets, const std::vector<U256>& amounts,
                            const Bytes& data) override {
        inner_.execute_flash_loan(caller, on_behalf, receiver, markets, amounts, data);
    }

    void set_actions_paused(const Address& c, const std::vector<Address>& m, const std::vector<Action>& a,
                            bool paused) override {
        inner_.set_actions_paused(c, m, a, paused);
    }
    void set_collateral_factor(const Address& c, uint32_t id, const Address& m, const U256& cf,
                               const U256& lt) override {
        inner_.set_collateral_factor(c, id, m, cf, lt);
    }
    void set_market_supply_caps(const Address& c, const std::vector<Address>& m,
                                const std::vector<U256>& caps) override {
        inner_.set_market_supply_caps(c, m, caps);
    }
    void set_market_borrow_caps(const Address& c, const std::vector<Address>& m,
                                const std::vector<U256>& caps) override {
        inner_.set_market_borrow_caps(c, m, caps);
    }
    uint32_t unlist_market(const Address& c, const Address& m) override { return inner_.unlist_market(c, m); }

protected:
    IMarketService& inner_;
};

} // namespace lever::test

#endif // LEVER_TEST_FIXTURES_HPP
