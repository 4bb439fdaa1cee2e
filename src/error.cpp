// =============================================================================
// error.cpp - Contract Error Names
// =============================================================================

#include "lever/error.hpp"

namespace lever {

const char* error_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ZeroAddress: return "ZeroAddress";
        case ErrorCode::ZeroAmount: return "ZeroAmount";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::Reentrancy: return "Reentrancy";
        case ErrorCode::MarketNotListed: return "MarketNotListed";
        case ErrorCode::UnknownToken: return "UnknownToken";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::InsufficientAllowance: return "InsufficientAllowance";
        case ErrorCode::FlashLoanNotEnabled: return "FlashLoanNotEnabled";
        case ErrorCode::InsufficientRepayment: return "InsufficientRepayment";
        case ErrorCode::InvalidCollateralFactor: return "InvalidCollateralFactor";
        case ErrorCode::DeadlineReached: return "DeadlineReached";
        case ErrorCode::SaltAlreadyUsed: return "SaltAlreadyUsed";
        case ErrorCode::ZeroFlashLoanAmount: return "ZeroFlashLoanAmount";
        case ErrorCode::VBNBNotSupported: return "VBNBNotSupported";
        case ErrorCode::NotAnApprovedDelegate: return "NotAnApprovedDelegate";
        case ErrorCode::IdenticalMarkets: return "IdenticalMarkets";
        case ErrorCode::TokenSwapCallFailed: return "TokenSwapCallFailed";
        case ErrorCode::SlippageExceeded: return "SlippageExceeded";
        case ErrorCode::InsufficientFundsToRepayFlashloan: return "InsufficientFundsToRepayFlashloan";
        case ErrorCode::LeverageCausesLiquidation: return "LeverageCausesLiquidation";
        case ErrorCode::UnauthorizedExecutor: return "UnauthorizedExecutor";
        case ErrorCode::InitiatorMismatch: return "InitiatorMismatch";
        case ErrorCode::OnBehalfMismatch: return "OnBehalfMismatch";
        case ErrorCode::FlashLoanAssetOrAmountMismatch: return "FlashLoanAssetOrAmountMismatch";
        case ErrorCode::InvalidExecuteOperation: return "InvalidExecuteOperation";
        case ErrorCode::MintBehalfFailed: return "MintBehalfFailed";
        case ErrorCode::BorrowBehalfFailed: return "BorrowBehalfFailed";
        case ErrorCode::RepayBehalfFailed: return "RepayBehalfFailed";
        case ErrorCode::RedeemBehalfFailed: return "RedeemBehalfFailed";
        case ErrorCode::EnterMarketFailed: return "EnterMarketFailed";
        case ErrorCode::AccrueInterestFailed: return "AccrueInterestFailed";
        case ErrorCode::InsufficientAmountOut: return "InsufficientAmountOut";
        case ErrorCode::PairNotApproved: return "PairNotApproved";
        case ErrorCode::NoVTokenBalance: return "NoVTokenBalance";
        case ErrorCode::NoBorrowBalance: return "NoBorrowBalance";
        case ErrorCode::SeizeFailed: return "SeizeFailed";
        case ErrorCode::SwapCausesLiquidation: return "SwapCausesLiquidation";
        case ErrorCode::UnauthorizedKeeper: return "UnauthorizedKeeper";
        case ErrorCode::ZeroDeviation: return "ZeroDeviation";
        case ErrorCode::ExceedsMaxDeviation: return "ExceedsMaxDeviation";
        case ErrorCode::TokenNotConfigured: return "TokenNotConfigured";
        case ErrorCode::TokenMonitoringDisabled: return "TokenMonitoringDisabled";
        case ErrorCode::InvalidPool: return "InvalidPool";
        case ErrorCode::UnsupportedDEX: return "UnsupportedDEX";
        case ErrorCode::MarketNotPausable: return "MarketNotPausable";
        case ErrorCode::MarketNotUnlistable: return "MarketNotUnlistable";
    }
    return "UnknownError";
}

ContractError::ContractError(ErrorCode code)
    : std::runtime_error(std::string(error_name(code)) + "()"), code_(code) {}

ContractError::ContractError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(error_name(code)) + "(" + detail + ")"), code_(code) {}

ContractError::ContractError(ErrorCode code, const Address& subject)
    : ContractError(code, to_hex(subject)) {}

} // namespace lever
