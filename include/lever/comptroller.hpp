#ifndef LEVER_COMPTROLLER_HPP
#define LEVER_COMPTROLLER_HPP

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "access.hpp"
#include "chain.hpp"
#include "market.hpp"
#include "oracle.hpp"
#include "token.hpp"
#include "types.hpp"

namespace lever {

// Function signatures checked against the access control manager
namespace signatures {
inline const std::string SUPPORT_MARKET = "_supportMarket(address)";
inline const std::string SET_ACTIONS_PAUSED = "_setActionsPaused(address[],uint8[],bool)";
inline const std::string SET_COLLATERAL_FACTOR = "setCollateralFactor(uint96,address,uint256,uint256)";
inline const std::string SET_SUPPLY_CAPS = "_setMarketSupplyCaps(address[],uint256[])";
inline const std::string SET_BORROW_CAPS = "_setMarketBorrowCaps(address[],uint256[])";
inline const std::string UNLIST_MARKET = "unlistMarket(address)";
inline const std::string CREATE_POOL = "createPool(string)";
inline const std::string ADD_POOL_MARKET = "addPoolMarkets(uint96[],address[])";
inline const std::string SET_IS_BORROW_ALLOWED = "setIsBorrowAllowed(uint96,address,bool)";
inline const std::string SET_TREASURY_DATA = "_setTreasuryData(address,address,uint256)";
inline const std::string SET_PROTOCOL_SHARE_RESERVE = "setProtocolShareReserve(address)";
inline const std::string SET_FLASH_LOAN_WHITELIST = "setWhiteListFlashLoanAccount(address,bool)";
inline const std::string SET_BORROW_RATE = "setBorrowRate(address,uint256)";
inline const std::string SET_WHITELISTED_EXECUTOR = "setWhitelistedExecutor(address,bool)";
}

// =============================================================================
// Market Configuration
// =============================================================================

struct MarketConfig {
    Address underlying;
    std::string symbol;                       // label of the market address
    U256 initial_exchange_rate = EXP_SCALE;   // underlying per share, mantissa
    U256 borrow_rate_per_second;              // mantissa
    U256 reserve_factor;                      // mantissa
    U256 flash_loan_fee;                      // mantissa
    bool flash_loan_enabled = true;
    bool native = false;                      // wraps the chain's native asset
};

// =============================================================================
// Market Accounting State
// =============================================================================

struct AccountSnapshot {
    U256 shares;
    U256 borrow_principal;
    U256 interest_index;
};

struct MarketRecord {
    MarketConfig config;
    bool listed = false;
    U256 total_supply;     // shares
    U256 total_borrows;
    U256 total_reserves;
    U256 borrow_index = EXP_SCALE;
    U256 flash_loans_outstanding;     // lent by an in-progress flash loan, still owned
    uint64_t accrual_timestamp = 0;
    std::optional<U256> supply_cap;   // unset = unlimited
    std::optional<U256> borrow_cap;
    std::set<Action> paused;
    std::map<Address, AccountSnapshot> accounts;
};

// =============================================================================
// SimulatedComptroller - in-memory Compound-style lending market
// =============================================================================

class SimulatedComptroller : public IMarketService {
public:
    SimulatedComptroller(Chain& chain, TokenLedger& tokens, const AccessControlManager& acm,
                         const IResilientOracle& oracle, PoolTopology topology);
    ~SimulatedComptroller() override = default;

    // Non-copyable
    SimulatedComptroller(const SimulatedComptroller&) = delete;
    SimulatedComptroller& operator=(const SimulatedComptroller&) = delete;

    Address address() const override { return self_; }

    // =========================================================================
    // Administration
    // =========================================================================

    Address support_market(const Address& caller, const MarketConfig& config);
    uint32_t add_pool(const Address& caller, const std::string& label);
    void add_pool_market(const Address& caller, uint32_t pool_id, const Address& market);
    void set_is_borrow_allowed(const Address& caller, uint32_t pool_id, const Address& market, bool allowed);
    void set_treasury_data(const Address& caller, const Address& treasury, const U256& percent);
    void set_protocol_share_reserve(const Address& caller, const Address& reserve);
    void set_whitelisted_flash_loan_account(const Address& caller, const Address& account, bool allowed);
    void set_borrow_rate(const Address& caller, const Address& market, const U256& rate_per_second);
    void set_whitelisted_executor(const Address& caller, const Address& account, bool allowed);

    // =========================================================================
    // IMarketService
    // =========================================================================

    bool is_listed(const Address& market) const override;
    Address underlying(const Address& market) const override;
    std::vector<Address> all_markets() const override;
    PoolTopology topology() const override { return topology_; }
    uint32_t last_pool_id() const override;
    PoolMarket pool_market(uint32_t pool_id, const Address& market) const override;
    bool action_paused(const Address& market, Action action) const override;
    U256 treasury_percent() const override;
    Address protocol_share_reserve() const override;

    bool approved_delegates(const Address& account, const Address& delegate) const override;
    std::vector<Address> assets_in(const Address& account) const override;

    uint32_t mint_behalf(const Address& caller, const Address& minter,
                         const Address& market, const U256& amount) override;
    uint32_t enter_market_behalf(const Address& caller, const Address& account,
                                 const Address& market) override;
    uint32_t borrow_behalf(const Address& caller, const Address& borrower,
                           const Address& market, const U256& amount) override;
    uint32_t repay_borrow_behalf(const Address& caller, const Address& borrower,
                                 const Address& market, const U256& amount) override;
    uint32_t redeem_underlying_behalf(const Address& caller, const Address& redeemer,
                                      const Address& market, const U256& amount) override;
    uint32_t redeem_behalf(const Address& caller, const Address& redeemer,
                           const Address& market, const U256& shares) override;
    uint32_t seize(const Address& caller, const Address& market, const Address& borrower,
                   const Address& recipient, const U256& shares) override;
    uint32_t accrue_interest(const Address& market) override;

    U256 borrow_balance_current(const Address& market, const Address& account) override;
    U256 borrow_balance_stored(const Address& market, const Address& account) const override;
    U256 balance_of_underlying(const Address& market, const Address& account) override;
    U256 exchange_rate_stored(const Address& market) const override;
    U256 balance_of(const Address& market, const Address& account) const override;
    U256 total_supply(const Address& market) const override;

    AccountLiquidity get_account_liquidity(const Address& account) const override;

    void execute_flash_loan(const Address& caller, const Address& on_behalf,
                            IFlashLoanReceiver& receiver,
                            const std::vector<Address>& markets,
                            const std::vector<U256>& amounts,
                            const Bytes& data) override;

    void set_actions_paused(const Address& caller, const std::vector<Address>& markets,
                            const std::vector<Action>& actions, bool paused) override;
    void set_collateral_factor(const Address& caller, uint32_t pool_id, const Address& market,
                               const U256& collateral_factor, const U256& liquidation_threshold) override;
    void set_market_supply_caps(const Address& caller, const std::vector<Address>& markets,
                                const std::vector<U256>& caps) override;
    void set_market_borrow_caps(const Address& caller, const std::vector<Address>& markets,
                                const std::vector<U256>& caps) override;
    uint32_t unlist_market(const Address& caller, const Address& market) override;

    // =========================================================================
    // User Entry Points (caller acts for itself)
    // =========================================================================

    void update_delegate(const Address& caller, const Address& delegate, bool approved);
    std::vector<uint32_t> enter_markets(const Address& caller, const std::vector<Address>& markets);
    uint32_t mint(const Address& caller, const Address& market, const U256& amount);
    uint32_t borrow(const Address& caller, const Address& market, const U256& amount);
    uint32_t repay_borrow(const Address& caller, const Address& market, const U256& amount);
    uint32_t redeem_underlying(const Address& caller, const Address& market, const U256& amount);

    // =========================================================================
    // Market Views
    // =========================================================================

    U256 get_cash(const Address& market) const;
    U256 total_borrows(const Address& market) const;
    U256 total_reserves(const Address& market) const;
    std::optional<U256> supply_cap(const Address& market) const;
    std::optional<U256> borrow_cap(const Address& market) const;
    bool is_flash_loan_whitelisted(const Address& account) const;
    bool is_whitelisted_executor(const Address& account) const;
    bool is_native_market(const Address& market) const;
    Address treasury() const;

private:
    struct State {
        std::map<Address, MarketRecord> markets;
        std::vector<Address> market_list;
        std::map<std::pair<uint32_t, Address>, PoolMarket> pool_markets;
        uint32_t last_pool_id = 0;
        std::map<Address, std::vector<Address>> assets_in;
        std::set<std::pair<Address, Address>> delegates;  // (account, delegate)
        std::set<Address> flash_loan_whitelist;
        std::set<Address> executors;
        Address treasury;
        U256 treasury_percent;
        Address protocol_share_reserve;
    };

    MarketRecord* find_market(const Address& market);
    const MarketRecord* find_market(const Address& market) const;
    MarketRecord& listed_market(const Address& market);

    void accrue(const Address& market, MarketRecord& record);
    U256 cash(const MarketRecord& record, const Address& market) const;
    U256 exchange_rate(const MarketRecord& record, const Address& market) const;
    U256 stored_borrow(const MarketRecord& record, const Address& account) const;
    bool can_act_for(const Address& caller, const Address& account) const;
    void add_asset(const Address& account, const Address& market);
    void require_lengths(size_t markets, size_t values) const;

    // Liquidity after hypothetically redeeming shares / borrowing in `modified`
    AccountLiquidity hypothetical_liquidity(const Address& account, const Address& modified,
                                            const U256& redeem_shares, const U256& borrow_amount) const;

    // Burns shares of redeemer and pays amount, less the treasury fee, to caller
    uint32_t redeem_fresh(const Address& caller, const Address& redeemer, const Address& market,
                          const U256& shares, const U256& amount);

    // Records debt for borrower; transfers funds to `recipient` unless it is zero
    uint32_t borrow_fresh(const Address& borrower, const Address& market, const U256& amount,
                          const Address& recipient);

    Chain& chain_;
    TokenLedger& tokens_;
    const AccessControlManager& acm_;
    const IResilientOracle& oracle_;
    PoolTopology topology_;
    Address self_;
    Storage<State> state_;
};

} // namespace lever

#endif // LEVER_COMPTROLLER_HPP
