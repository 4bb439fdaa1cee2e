#ifndef LEVER_LEVERAGE_HPP
#define LEVER_LEVERAGE_HPP

#include <variant>
#include <vector>

#include "chain.hpp"
#include "converter.hpp"
#include "market.hpp"
#include "token.hpp"
#include "transient.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Pending Operations (resumed by the flash-loan callback)
// =============================================================================

struct EnterSingleAsset {
    Address market;
    U256 seed;
};

struct Enter {
    Address collateral_market;
    U256 collateral_seed;
    Address borrow_market;
    U256 min_collateral_after_swap;
    SwapInstructions swap;
};

struct EnterFromBorrow {
    Address collateral_market;
    Address borrow_market;
    U256 borrowed_seed;
    U256 min_collateral_after_swap;
    SwapInstructions swap;
};

struct Exit {
    Address collateral_market;
    U256 collateral_redeem_amount;
    Address borrow_market;
    U256 min_borrowed_after_swap;
    SwapInstructions swap;
};

struct ExitSingleAsset {
    Address market;
};

using PendingOperation = std::variant<EnterSingleAsset, Enter, EnterFromBorrow, Exit, ExitSingleAsset>;

// In-flight state of one top-level operation
struct OperationContext {
    Address initiator;
    Address flash_market;
    U256 flash_amount;
    PendingOperation operation;
};

// =============================================================================
// LeverageStrategiesManager
//
// Opens and closes leveraged positions for the calling account in one atomic
// transaction: flash loan, optional swap through the token converter, then
// mint/borrow (enter) or repay/redeem (exit) on the account's behalf. The
// manager must be an approved delegate of the account. Every operation ends
// with a solvency check and leaves no token balance behind. Borrowed-asset
// dust of an exit goes to the protocol share reserve.
// =============================================================================

class LeverageStrategiesManager : public IFlashLoanReceiver {
public:
    LeverageStrategiesManager(Chain& chain, TokenLedger& tokens, IMarketService& comptroller,
                              ITokenConverter& converter, const Address& native_market,
                              const Address& protocol_share_reserve);

    // Non-copyable
    LeverageStrategiesManager(const LeverageStrategiesManager&) = delete;
    LeverageStrategiesManager& operator=(const LeverageStrategiesManager&) = delete;

    Address address() const override { return self_; }
    const Address& native_market() const { return native_market_; }
    const Address& protocol_share_reserve() const { return protocol_share_reserve_; }

    // =========================================================================
    // Entry
    // =========================================================================

    void enter_single_asset_leverage(const Address& caller, const Address& market,
                                     const U256& seed_amount, const U256& flash_loan_amount);

    void enter_leverage(const Address& caller, const Address& collateral_market,
                        const U256& collateral_seed, const Address& borrow_market,
                        const U256& flash_loan_amount, const U256& min_collateral_after_swap,
                        const SwapInstructions& swap);

    void enter_leverage_from_borrow(const Address& caller, const Address& collateral_market,
                                    const Address& borrow_market, const U256& borrowed_seed,
                                    const U256& flash_loan_amount, const U256& min_collateral_after_swap,
                                    const SwapInstructions& swap);

    // =========================================================================
    // Exit
    // =========================================================================

    void exit_leverage(const Address& caller, const Address& collateral_market,
                       const U256& collateral_redeem_amount, const Address& borrow_market,
                       const U256& repay_flash_loan_amount, const U256& min_borrowed_after_swap,
                       const SwapInstructions& swap);

    void exit_single_asset_leverage(const Address& caller, const Address& market,
                                    const U256& flash_loan_amount);

    // =========================================================================
    // Flash-loan callback
    // =========================================================================

    std::vector<U256> execute_operation(const Address& caller,
                                        const std::vector<Address>& markets,
                                        const std::vector<U256>& amounts,
                                        const std::vector<U256>& premiums,
                                        const Address& initiator,
                                        const Address& on_behalf,
                                        const Bytes& data) override;

    // An operation of this manager is in flight on the calling thread
    bool operation_in_flight() const { return pending_.occupied(); }

private:
    // Continuations, one per pending operation kind. Each returns the amount
    // of the flash loan to hand back to the market.
    U256 resume(const Address& initiator, const EnterSingleAsset& op, const U256& amount, const U256& premium);
    U256 resume(const Address& initiator, const Enter& op, const U256& amount, const U256& premium);
    U256 resume(const Address& initiator, const EnterFromBorrow& op, const U256& amount, const U256& premium);
    U256 resume(const Address& initiator, const Exit& op, const U256& amount, const U256& premium);
    U256 resume(const Address& initiator, const ExitSingleAsset& op, const U256& amount, const U256& premium);

    void validate_market(const Address& market) const;
    void validate_delegation(const Address& initiator) const;
    void accrue(const Address& market);
    void enter_market(const Address& initiator, const Address& market);
    void mint(const Address& initiator, const Address& market, const U256& amount);
    void borrow(const Address& initiator, const Address& market, const U256& amount);
    U256 repay_capped(const Address& initiator, const Address& market, const U256& available);
    U256 redeem(const Address& initiator, const Address& market, const U256& amount);

    // Sends amount_in to the converter, runs the instructions and returns the
    // amount of token_out received
    U256 swap(const Address& token_in, const U256& amount_in, const Address& token_out,
              const SwapInstructions& instructions);

    void flash_loan(const Address& initiator, const Address& market, const U256& amount);
    void check_solvency(const Address& initiator);
    void transfer_dust(const Address& token, const Address& recipient);
    void pull(const Address& token, const Address& from, const U256& amount);
    U256 balance(const Address& token) const;

    Chain& chain_;
    TokenLedger& tokens_;
    IMarketService& comptroller_;
    ITokenConverter& converter_;
    Address native_market_;
    Address protocol_share_reserve_;
    Address self_;
    TransientSlot<OperationContext> pending_;
};

} // namespace lever

#endif // LEVER_LEVERAGE_HPP
