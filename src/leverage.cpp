// =============================================================================
// leverage.cpp - Leverage Strategies Manager Implementation
// =============================================================================

#include "lever/leverage.hpp"

#include <algorithm>
#include <string>

#include "lever/error.hpp"
#include "lever/log.hpp"

namespace lever {

namespace {

std::string code_detail(uint32_t code) {
    return "code " + std::to_string(code);
}

} // namespace

LeverageStrategiesManager::LeverageStrategiesManager(Chain& chain, TokenLedger& tokens,
                                                     IMarketService& comptroller,
                                                     ITokenConverter& converter,
                                                     const Address& native_market,
                                                     const Address& protocol_share_reserve)
    : chain_(chain),
      tokens_(tokens),
      comptroller_(comptroller),
      converter_(converter),
      native_market_(native_market),
      protocol_share_reserve_(protocol_share_reserve),
      self_(chain.create_address("LeverageStrategiesManager")) {
    if (is_zero(comptroller.address()) || is_zero(converter.address()) || is_zero(native_market) ||
        is_zero(protocol_share_reserve)) {
        throw ContractError(ErrorCode::ZeroAddress);
    }
}

// =============================================================================
// Entry
// =============================================================================

void LeverageStrategiesManager::enter_single_asset_leverage(const Address& caller, const Address& market,
                                                            const U256& seed_amount,
                                                            const U256& flash_loan_amount) {
    chain_.transact([&] {
        if (flash_loan_amount == 0) throw ContractError(ErrorCode::ZeroFlashLoanAmount);
        validate_market(market);
        validate_delegation(caller);

        TransientSlot<OperationContext>::Scope scope(
            pending_, OperationContext{caller, market, flash_loan_amount, EnterSingleAsset{market, seed_amount}});

        Address token = comptroller_.underlying(market);
        accrue(market);
        pull(token, caller, seed_amount);

        flash_loan(caller, market, flash_loan_amount);
        check_solvency(caller);
        transfer_dust(token, caller);

        chain_.emit(self_, "SingleAssetLeverageEntered",
                    {{"user", to_hex(caller)}, {"market", to_hex(market)},
                     {"seedAmount", seed_amount.str()}, {"flashLoanAmount", flash_loan_amount.str()}});
        Logger::info("leverage: {} entered single asset position on {}", to_hex(caller), to_hex(market));
    });
}

void LeverageStrategiesManager::enter_leverage(const Address& caller, const Address& collateral_market,
                                               const U256& collateral_seed, const Address& borrow_market,
                                               const U256& flash_loan_amount,
                                               const U256& min_collateral_after_swap,
                                               const SwapInstructions& swap) {
    chain_.transact([&] {
        if (flash_loan_amount == 0) throw ContractError(ErrorCode::ZeroFlashLoanAmount);
        validate_market(collateral_market);
        validate_market(borrow_market);
        if (collateral_market == borrow_market) throw ContractError(ErrorCode::IdenticalMarkets);
        validate_delegation(caller);

        TransientSlot<OperationContext>::Scope scope(
            pending_, OperationContext{caller, borrow_market, flash_loan_amount,
                                       Enter{collateral_market, collateral_seed, borrow_market,
                                             min_collateral_after_swap, swap}});

        Address collateral_token = comptroller_.underlying(collateral_market);
        Address borrowed_token = comptroller_.underlying(borrow_market);
        accrue(collateral_market);
        accrue(borrow_market);
        pull(collateral_token, caller, collateral_seed);

        flash_loan(caller, borrow_market, flash_loan_amount);
        check_solvency(caller);
        transfer_dust(collateral_token, caller);
        transfer_dust(borrowed_token, caller);

        chain_.emit(self_, "LeverageEntered",
                    {{"user", to_hex(caller)},
                     {"collateralMarket", to_hex(collateral_market)},
                     {"collateralAmountSeed", collateral_seed.str()},
                     {"borrowedMarket", to_hex(borrow_market)},
                     {"borrowedAmountToFlashLoan", flash_loan_amount.str()}});
        Logger::info("leverage: {} entered position {} / {}", to_hex(caller),
                     to_hex(collateral_market), to_hex(borrow_market));
    });
}

void LeverageStrategiesManager::enter_leverage_from_borrow(const Address& caller, const Address& collateral_market,
                                                           const Address& borrow_market, const U256& borrowed_seed,
                                                           const U256& flash_loan_amount,
                                                           const U256& min_collateral_after_swap,
                                                           const SwapInstructions& swap) {
    chain_.transact([&] {
        if (flash_loan_amount == 0) throw ContractError(ErrorCode::ZeroFlashLoanAmount);
        validate_market(collateral_market);
        validate_market(borrow_market);
        if (collateral_market == borrow_market) throw ContractError(ErrorCode::IdenticalMarkets);
        validate_delegation(caller);

        TransientSlot<OperationContext>::Scope scope(
            pending_, OperationContext{caller, borrow_market, flash_loan_amount,
                                       EnterFromBorrow{collateral_market, borrow_market, borrowed_seed,
                                                       min_collateral_after_swap, swap}});

        Address collateral_token = comptroller_.underlying(collateral_market);
        Address borrowed_token = comptroller_.underlying(borrow_market);
        accrue(collateral_market);
        accrue(borrow_market);
        pull(borrowed_token, caller, borrowed_seed);

        flash_loan(caller, borrow_market, flash_loan_amount);
        check_solvency(caller);
        transfer_dust(collateral_token, caller);
        transfer_dust(borrowed_token, caller);

        chain_.emit(self_, "LeverageEnteredFromBorrow",
                    {{"user", to_hex(caller)},
                     {"collateralMarket", to_hex(collateral_market)},
                     {"borrowedMarket", to_hex(borrow_market)},
                     {"borrowedAmountSeed", borrowed_seed.str()},
                     {"borrowedAmountToFlashLoan", flash_loan_amount.str()}});
        Logger::info("leverage: {} entered position from borrow {} / {}", to_hex(caller),
                     to_hex(collateral_market), to_hex(borrow_market));
    });
}

// =============================================================================
// Exit
// =============================================================================

void LeverageStrategiesManager::exit_leverage(const Address& caller, const Address& collateral_market,
                                              const U256& collateral_redeem_amount, const Address& borrow_market,
                                              const U256& repay_flash_loan_amount,
                                              const U256& min_borrowed_after_swap,
                                              const SwapInstructions& swap) {
    chain_.transact([&] {
        if (repay_flash_loan_amount == 0) throw ContractError(ErrorCode::ZeroFlashLoanAmount);
        validate_market(collateral_market);
        validate_market(borrow_market);
        if (collateral_market == borrow_market) throw ContractError(ErrorCode::IdenticalMarkets);
        validate_delegation(caller);

        TransientSlot<OperationContext>::Scope scope(
            pending_, OperationContext{caller, borrow_market, repay_flash_loan_amount,
                                       Exit{collateral_market, collateral_redeem_amount, borrow_market,
                                            min_borrowed_after_swap, swap}});

        Address collateral_token = comptroller_.underlying(collateral_market);
        Address borrowed_token = comptroller_.underlying(borrow_market);
        accrue(collateral_market);
        accrue(borrow_market);

        flash_loan(caller, borrow_market, repay_flash_loan_amount);
        check_solvency(caller);
        transfer_dust(collateral_token, caller);
        transfer_dust(borrowed_token, protocol_share_reserve_);

        chain_.emit(self_, "LeverageExited",
                    {{"user", to_hex(caller)},
                     {"collateralMarket", to_hex(collateral_market)},
                     {"collateralAmountToRedeemForSwap", collateral_redeem_amount.str()},
                     {"borrowedMarket", to_hex(borrow_market)},
                     {"borrowedAmountToFlashLoan", repay_flash_loan_amount.str()}});
        Logger::info("leverage: {} exited position {} / {}", to_hex(caller),
                     to_hex(collateral_market), to_hex(borrow_market));
    });
}

void LeverageStrategiesManager::exit_single_asset_leverage(const Address& caller, const Address& market,
                                                           const U256& flash_loan_amount) {
    chain_.transact([&] {
        if (flash_loan_amount == 0) throw ContractError(ErrorCode::ZeroFlashLoanAmount);
        validate_market(market);
        validate_delegation(caller);

        TransientSlot<OperationContext>::Scope scope(
            pending_, OperationContext{caller, market, flash_loan_amount, ExitSingleAsset{market}});

        Address token = comptroller_.underlying(market);
        accrue(market);

        flash_loan(caller, market, flash_loan_amount);
        check_solvency(caller);
        // Same asset on both sides: leftovers were redeemed from the user's collateral
        transfer_dust(token, caller);

        chain_.emit(self_, "SingleAssetLeverageExited",
                    {{"user", to_hex(caller)}, {"market", to_hex(market)},
                     {"flashLoanAmount", flash_loan_amount.str()}});
        Logger::info("leverage: {} exited single asset position on {}", to_hex(caller), to_hex(market));
    });
}

// =============================================================================
// Flash-loan Callback
// =============================================================================

std::vector<U256> LeverageStrategiesManager::execute_operation(const Address& caller,
                                                               const std::vector<Address>& markets,
                                                               const std::vector<U256>& amounts,
                                                               const std::vector<U256>& premiums,
                                                               const Address& initiator,
                                                               const Address& on_behalf,
                                                               const Bytes& data) {
    return chain_.transact([&] {
        if (caller != comptroller_.address()) throw ContractError(ErrorCode::UnauthorizedExecutor, caller);
        if (markets.size() != 1 || amounts.size() != 1 || premiums.size() != 1) {
            throw ContractError(ErrorCode::FlashLoanAssetOrAmountMismatch);
        }
        if (initiator != self_) throw ContractError(ErrorCode::InitiatorMismatch, initiator);

        const OperationContext* recorded = pending_.peek();
        if (on_behalf != (recorded ? recorded->initiator : ZERO_ADDRESS)) {
            throw ContractError(ErrorCode::OnBehalfMismatch, on_behalf);
        }

        std::optional<OperationContext> context = pending_.take();
        if (!context) throw ContractError(ErrorCode::InvalidExecuteOperation);
        if (markets[0] != context->flash_market || amounts[0] != context->flash_amount) {
            throw ContractError(ErrorCode::FlashLoanAssetOrAmountMismatch);
        }

        Logger::debug("leverage: callback for {} ({} bytes of data)", to_hex(context->initiator), data.size());

        const U256& amount = amounts[0];
        const U256& premium = premiums[0];
        U256 repayment = std::visit(
            [&](const auto& op) { return resume(context->initiator, op, amount, premium); },
            context->operation);

        tokens_.approve(self_, comptroller_.underlying(markets[0]), markets[0], repayment);
        return std::vector<U256>{repayment};
    });
}

U256 LeverageStrategiesManager::resume(const Address& initiator, const EnterSingleAsset& op,
                                       const U256& amount, const U256& premium) {
    mint(initiator, op.market, op.seed + amount);

    U256 owed = amount + premium;
    borrow(initiator, op.market, owed);
    return owed;
}

U256 LeverageStrategiesManager::resume(const Address& initiator, const Enter& op,
                                       const U256& amount, const U256& premium) {
    Address collateral_token = comptroller_.underlying(op.collateral_market);
    Address borrowed_token = comptroller_.underlying(op.borrow_market);

    U256 converted = swap(borrowed_token, amount, collateral_token, op.swap);
    if (converted < op.min_collateral_after_swap) {
        throw ContractError(ErrorCode::SlippageExceeded,
                            converted.str() + " < " + op.min_collateral_after_swap.str());
    }
    mint(initiator, op.collateral_market, converted + op.collateral_seed);

    U256 owed = amount + premium;
    borrow(initiator, op.borrow_market, owed);
    return owed;
}

U256 LeverageStrategiesManager::resume(const Address& initiator, const EnterFromBorrow& op,
                                       const U256& amount, const U256& premium) {
    Address collateral_token = comptroller_.underlying(op.collateral_market);
    Address borrowed_token = comptroller_.underlying(op.borrow_market);

    U256 converted = swap(borrowed_token, amount + op.borrowed_seed, collateral_token, op.swap);
    if (converted < op.min_collateral_after_swap) {
        throw ContractError(ErrorCode::SlippageExceeded,
                            converted.str() + " < " + op.min_collateral_after_swap.str());
    }
    mint(initiator, op.collateral_market, converted);

    U256 owed = amount + premium;
    borrow(initiator, op.borrow_market, owed);
    return owed;
}

U256 LeverageStrategiesManager::resume(const Address& initiator, const Exit& op,
                                       const U256& amount, const U256& premium) {
    Address collateral_token = comptroller_.underlying(op.collateral_market);
    Address borrowed_token = comptroller_.underlying(op.borrow_market);

    repay_capped(initiator, op.borrow_market, amount);
    U256 redeemed = redeem(initiator, op.collateral_market, op.collateral_redeem_amount);

    U256 proceeds = swap(collateral_token, redeemed, borrowed_token, op.swap);
    if (proceeds < op.min_borrowed_after_swap) {
        throw ContractError(ErrorCode::SlippageExceeded, proceeds.str() + " < " + op.min_borrowed_after_swap.str());
    }

    U256 owed = amount + premium;
    U256 available = balance(borrowed_token);
    if (available < owed) {
        throw ContractError(ErrorCode::InsufficientFundsToRepayFlashloan, available.str() + " < " + owed.str());
    }
    return owed;
}

U256 LeverageStrategiesManager::resume(const Address& initiator, const ExitSingleAsset& op,
                                       const U256& amount, const U256& premium) {
    Address token = comptroller_.underlying(op.market);

    U256 repaid = repay_capped(initiator, op.market, amount);

    // The market keeps treasury_percent of every redemption; gross up so the
    // received amount covers what the flash loan still needs.
    U256 needed = repaid + premium;
    if (needed > 0) {
        U256 keep = EXP_SCALE - comptroller_.treasury_percent();
        redeem(initiator, op.market, amounts::mul_div_up(needed, EXP_SCALE, keep));
    }

    U256 owed = amount + premium;
    U256 available = balance(token);
    if (available < owed) {
        throw ContractError(ErrorCode::InsufficientFundsToRepayFlashloan, available.str() + " < " + owed.str());
    }
    return owed;
}

// =============================================================================
// Market Steps
// =============================================================================

void LeverageStrategiesManager::validate_market(const Address& market) const {
    if (!comptroller_.is_listed(market)) throw ContractError(ErrorCode::MarketNotListed, market);
    if (market == native_market_) throw ContractError(ErrorCode::VBNBNotSupported, market);
}

void LeverageStrategiesManager::validate_delegation(const Address& initiator) const {
    if (!comptroller_.approved_delegates(initiator, self_)) {
        throw ContractError(ErrorCode::NotAnApprovedDelegate, initiator);
    }
}

void LeverageStrategiesManager::accrue(const Address& market) {
    uint32_t code = comptroller_.accrue_interest(market);
    if (code != market_errors::OK) throw ContractError(ErrorCode::AccrueInterestFailed, code_detail(code));
}

void LeverageStrategiesManager::enter_market(const Address& initiator, const Address& market) {
    std::vector<Address> assets = comptroller_.assets_in(initiator);
    if (std::find(assets.begin(), assets.end(), market) != assets.end()) return;

    uint32_t code = comptroller_.enter_market_behalf(self_, initiator, market);
    if (code != market_errors::OK) throw ContractError(ErrorCode::EnterMarketFailed, code_detail(code));
}

void LeverageStrategiesManager::mint(const Address& initiator, const Address& market, const U256& amount) {
    tokens_.approve(self_, comptroller_.underlying(market), market, amount);
    uint32_t code = comptroller_.mint_behalf(self_, initiator, market, amount);
    if (code != market_errors::OK) throw ContractError(ErrorCode::MintBehalfFailed, code_detail(code));
    enter_market(initiator, market);
}

void LeverageStrategiesManager::borrow(const Address& initiator, const Address& market, const U256& amount) {
    uint32_t code = comptroller_.borrow_behalf(self_, initiator, market, amount);
    if (code != market_errors::OK) throw ContractError(ErrorCode::BorrowBehalfFailed, code_detail(code));
}

U256 LeverageStrategiesManager::repay_capped(const Address& initiator, const Address& market,
                                             const U256& available) {
    // Flash amounts above the debt absorb interest accrued since the quote
    U256 debt = comptroller_.borrow_balance_current(market, initiator);
    U256 repay = std::min(available, debt);
    if (repay == 0) return repay;

    tokens_.approve(self_, comptroller_.underlying(market), market, repay);
    uint32_t code = comptroller_.repay_borrow_behalf(self_, initiator, market, repay);
    if (code != market_errors::OK) throw ContractError(ErrorCode::RepayBehalfFailed, code_detail(code));
    return repay;
}

U256 LeverageStrategiesManager::redeem(const Address& initiator, const Address& market, const U256& amount) {
    Address token = comptroller_.underlying(market);
    U256 before = balance(token);

    uint32_t code = comptroller_.redeem_underlying_behalf(self_, initiator, market, amount);
    if (code != market_errors::OK) throw ContractError(ErrorCode::RedeemBehalfFailed, code_detail(code));
    return balance(token) - before;
}

U256 LeverageStrategiesManager::swap(const Address& token_in, const U256& amount_in, const Address& token_out,
                                     const SwapInstructions& instructions) {
    U256 before = balance(token_out);
    if (amount_in > 0) tokens_.transfer(self_, token_in, converter_.address(), amount_in);

    try {
        converter_.multicall(self_, instructions);
    } catch (const std::exception& e) {
        Logger::warning("leverage: token converter reverted: {}", e.what());
        throw ContractError(ErrorCode::TokenSwapCallFailed, e.what());
    }

    U256 after = balance(token_out);
    if (after <= before) throw ContractError(ErrorCode::TokenSwapCallFailed, "no output");
    return after - before;
}

void LeverageStrategiesManager::flash_loan(const Address& initiator, const Address& market, const U256& amount) {
    comptroller_.execute_flash_loan(self_, initiator, *this, {market}, {amount}, Bytes{});
    if (pending_.active()) throw ContractError(ErrorCode::InvalidExecuteOperation, "callback not executed");
}

void LeverageStrategiesManager::check_solvency(const Address& initiator) {
    for (const auto& market : comptroller_.assets_in(initiator)) accrue(market);

    AccountLiquidity liquidity = comptroller_.get_account_liquidity(initiator);
    if (liquidity.error != market_errors::OK || liquidity.shortfall > 0) {
        throw ContractError(ErrorCode::LeverageCausesLiquidation,
                            "error " + std::to_string(liquidity.error) + ", shortfall " + liquidity.shortfall.str());
    }
}

void LeverageStrategiesManager::transfer_dust(const Address& token, const Address& recipient) {
    U256 dust = balance(token);
    if (dust == 0) return;

    tokens_.transfer(self_, token, recipient, dust);
    chain_.emit(self_, "DustTransferred",
                {{"recipient", to_hex(recipient)}, {"token", to_hex(token)}, {"amount", dust.str()}});
}

void LeverageStrategiesManager::pull(const Address& token, const Address& from, const U256& amount) {
    if (amount == 0) return;
    tokens_.transfer_from(self_, token, from, self_, amount);
}

U256 LeverageStrategiesManager::balance(const Address& token) const {
    return tokens_.balance_of(token, self_);
}

} // namespace lever
