#ifndef LEVER_ERROR_HPP
#define LEVER_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace lever {

// =============================================================================
// Contract Error Codes (custom errors raised by reverting calls)
// =============================================================================

enum class ErrorCode : uint16_t {
    // Common
    ZeroAddress,
    ZeroAmount,
    Unauthorized,
    Reentrancy,
    MarketNotListed,

    // Token ledger
    UnknownToken,
    InsufficientBalance,
    InsufficientAllowance,

    // Market service
    FlashLoanNotEnabled,
    InsufficientRepayment,
    InvalidCollateralFactor,

    // Token converter
    DeadlineReached,
    SaltAlreadyUsed,

    // Leverage orchestrator
    ZeroFlashLoanAmount,
    VBNBNotSupported,
    NotAnApprovedDelegate,
    IdenticalMarkets,
    TokenSwapCallFailed,
    SlippageExceeded,
    InsufficientFundsToRepayFlashloan,
    LeverageCausesLiquidation,
    UnauthorizedExecutor,
    InitiatorMismatch,
    OnBehalfMismatch,
    FlashLoanAssetOrAmountMismatch,
    InvalidExecuteOperation,
    MintBehalfFailed,
    BorrowBehalfFailed,
    RepayBehalfFailed,
    RedeemBehalfFailed,
    EnterMarketFailed,
    AccrueInterestFailed,

    // Swap router and position swapper
    InsufficientAmountOut,
    PairNotApproved,
    NoVTokenBalance,
    NoBorrowBalance,
    SeizeFailed,
    SwapCausesLiquidation,

    // Deviation sentinel and DEX oracles
    UnauthorizedKeeper,
    ZeroDeviation,
    ExceedsMaxDeviation,
    TokenNotConfigured,
    TokenMonitoringDisabled,
    InvalidPool,
    UnsupportedDEX,

    // Undertaker
    MarketNotPausable,
    MarketNotUnlistable,
};

const char* error_name(ErrorCode code) noexcept;

// Revert raised by a simulated contract call. what() renders the custom
// error the way a decoded revert reads: "MarketNotListed(0x1e5e...)".
class ContractError : public std::runtime_error {
public:
    explicit ContractError(ErrorCode code);
    ContractError(ErrorCode code, const std::string& detail);
    ContractError(ErrorCode code, const Address& subject);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace lever

#endif // LEVER_ERROR_HPP
