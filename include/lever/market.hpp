#ifndef LEVER_MARKET_HPP
#define LEVER_MARKET_HPP

#include <cstdint>
#include <vector>

#include "types.hpp"

namespace lever {

// =============================================================================
// Market Actions (pausable per market)
// =============================================================================

enum class Action : uint8_t {
    MINT = 0,
    REDEEM = 1,
    BORROW = 2,
    REPAY = 3,
    SEIZE = 4,
    LIQUIDATE = 5,
    TRANSFER = 6,
    ENTER_MARKET = 7,
    EXIT_MARKET = 8,
};

// CORE: one market can be listed in pools 0..last_pool_id, each with its own
// risk factors. ISOLATED: a single pool (id 0).
enum class PoolTopology : uint8_t {
    CORE = 0,
    ISOLATED = 1,
};

// =============================================================================
// Market Service Error Codes (0 = success)
// =============================================================================

namespace market_errors {
constexpr uint32_t OK = 0;
constexpr uint32_t UNAUTHORIZED = 1;
constexpr uint32_t INSUFFICIENT_LIQUIDITY = 4;
constexpr uint32_t MARKET_NOT_LISTED = 9;
constexpr uint32_t PRICE_ERROR = 13;
constexpr uint32_t REJECTION = 14;
constexpr uint32_t TOO_MUCH_REPAY = 17;
constexpr uint32_t ACTION_PAUSED = 20;
constexpr uint32_t SUPPLY_CAP_REACHED = 21;
constexpr uint32_t BORROW_CAP_REACHED = 22;
constexpr uint32_t BORROW_NOT_ALLOWED = 23;
constexpr uint32_t DELEGATE_NOT_APPROVED = 24;
constexpr uint32_t INSUFFICIENT_CASH = 25;
constexpr uint32_t INSUFFICIENT_BALANCE = 26;
}

// =============================================================================
// Pool Market (per pool risk factors)
// =============================================================================

struct PoolMarket {
    bool listed = false;
    U256 collateral_factor;       // mantissa
    U256 liquidation_threshold;   // mantissa
    bool borrow_allowed = true;
};

struct AccountLiquidity {
    uint32_t error = market_errors::OK;
    U256 liquidity;
    U256 shortfall;
};

// =============================================================================
// IFlashLoanReceiver
// =============================================================================

class IFlashLoanReceiver {
public:
    virtual ~IFlashLoanReceiver() = default;

    virtual Address address() const = 0;

    // Called by the flash-loan originator (caller) after lending amounts[i] of
    // markets[i]'s underlying. Returns the amount of each loan to pull back;
    // whatever is not repaid of amount + premium becomes debt of on_behalf.
    virtual std::vector<U256> execute_operation(const Address& caller,
                                                const std::vector<Address>& markets,
                                                const std::vector<U256>& amounts,
                                                const std::vector<U256>& premiums,
                                                const Address& initiator,
                                                const Address& on_behalf,
                                                const Bytes& data) = 0;
};

// =============================================================================
// IMarketService - lending-market primitives consumed by the orchestrator,
// the sentinel and the undertaker
// =============================================================================

class IMarketService {
public:
    virtual ~IMarketService() = default;

    virtual Address address() const = 0;

    // =========================================================================
    // Markets & Topology
    // =========================================================================

    virtual bool is_listed(const Address& market) const = 0;
    virtual Address underlying(const Address& market) const = 0;
    virtual std::vector<Address> all_markets() const = 0;
    virtual PoolTopology topology() const = 0;
    virtual uint32_t last_pool_id() const = 0;
    virtual PoolMarket pool_market(uint32_t pool_id, const Address& market) const = 0;
    virtual bool action_paused(const Address& market, Action action) const = 0;
    virtual U256 treasury_percent() const = 0;
    virtual Address protocol_share_reserve() const = 0;

    // =========================================================================
    // Accounts
    // =========================================================================

    virtual bool approved_delegates(const Address& account, const Address& delegate) const = 0;
    virtual std::vector<Address> assets_in(const Address& account) const = 0;

    virtual uint32_t mint_behalf(const Address& caller, const Address& minter,
                                 const Address& market, const U256& amount) = 0;
    virtual uint32_t enter_market_behalf(const Address& caller, const Address& account,
                                         const Address& market) = 0;
    virtual uint32_t borrow_behalf(const Address& caller, const Address& borrower,
                                   const Address& market, const U256& amount) = 0;
    virtual uint32_t repay_borrow_behalf(const Address& caller, const Address& borrower,
                                         const Address& market, const U256& amount) = 0;
    virtual uint32_t redeem_underlying_behalf(const Address& caller, const Address& redeemer,
                                              const Address& market, const U256& amount) = 0;
    virtual uint32_t redeem_behalf(const Address& caller, const Address& redeemer,
                                   const Address& market, const U256& shares) = 0;

    // Moves shares of borrower to recipient without a liquidity check; only
    // whitelisted executors may call it
    virtual uint32_t seize(const Address& caller, const Address& market, const Address& borrower,
                           const Address& recipient, const U256& shares) = 0;
    virtual uint32_t accrue_interest(const Address& market) = 0;

    virtual U256 borrow_balance_current(const Address& market, const Address& account) = 0;
    virtual U256 borrow_balance_stored(const Address& market, const Address& account) const = 0;
    virtual U256 balance_of_underlying(const Address& market, const Address& account) = 0;
    virtual U256 exchange_rate_stored(const Address& market) const = 0;
    virtual U256 balance_of(const Address& market, const Address& account) const = 0;  // shares
    virtual U256 total_supply(const Address& market) const = 0;

    virtual AccountLiquidity get_account_liquidity(const Address& account) const = 0;

    // =========================================================================
    // Flash Loans
    // =========================================================================

    virtual void execute_flash_loan(const Address& caller, const Address& on_behalf,
                                    IFlashLoanReceiver& receiver,
                                    const std::vector<Address>& markets,
                                    const std::vector<U256>& amounts,
                                    const Bytes& data) = 0;

    // =========================================================================
    // Governance (access controlled, reverting)
    // =========================================================================

    virtual void set_actions_paused(const Address& caller, const std::vector<Address>& markets,
                                    const std::vector<Action>& actions, bool paused) = 0;
    virtual void set_collateral_factor(const Address& caller, uint32_t pool_id, const Address& market,
                                       const U256& collateral_factor,
                                       const U256& liquidation_threshold) = 0;
    virtual void set_market_supply_caps(const Address& caller, const std::vector<Address>& markets,
                                        const std::vector<U256>& caps) = 0;
    virtual void set_market_borrow_caps(const Address& caller, const std::vector<Address>& markets,
                                        const std::vector<U256>& caps) = 0;

    // Returns a market error code; requires MINT, BORROW and ENTER_MARKET
    // paused, a zero collateral factor and zero caps
    virtual uint32_t unlist_market(const Address& caller, const Address& market) = 0;
};

} // namespace lever

#endif // LEVER_MARKET_HPP
