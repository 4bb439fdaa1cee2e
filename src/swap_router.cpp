// =============================================================================
// swap_router.cpp - Swap Router (swap then supply / repay)
// =============================================================================

#include "lever/swap_router.hpp"

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

SwapRouter::SwapRouter(Chain& chain, TokenLedger& tokens, IMarketService& comptroller, ITokenConverter& converter,
                       const Address& native_market, const Address& owner)
    : chain_(chain),
      tokens_(tokens),
      comptroller_(comptroller),
      converter_(converter),
      native_market_(native_market),
      owner_(owner),
      self_(chain.create_address("SwapRouter")) {
    if (is_zero(comptroller.address()) || is_zero(converter.address()) || is_zero(native_market) ||
        is_zero(owner)) {
        throw ContractError(ErrorCode::ZeroAddress);
    }
}

// =============================================================================
// Supply
// =============================================================================

void SwapRouter::swap_and_supply(const Address& caller, const Address& market, const Address& token_in,
                                 const U256& amount_in, const U256& min_amount_out,
                                 const SwapInstructions& swap) {
    chain_.transact([&] {
        TransientSlot<Address>::Scope scope(lock_, caller);
        validate(market, amount_in);

        Address token_out = comptroller_.underlying(market);
        pull(token_in, caller, amount_in);
        U256 amount_out = this->swap(token_in, amount_in, token_out, swap);
        if (amount_out < min_amount_out) {
            throw ContractError(ErrorCode::InsufficientAmountOut, amount_out.str() + " < " + min_amount_out.str());
        }

        tokens_.approve(self_, token_out, market, amount_out);
        uint32_t code = comptroller_.mint_behalf(self_, caller, market, amount_out);
        if (code != market_errors::OK) throw ContractError(ErrorCode::MintBehalfFailed, code_detail(code));

        chain_.emit(self_, "SwapAndSupply",
                    {{"user", to_hex(caller)}, {"vToken", to_hex(market)},
                     {"tokenIn", to_hex(token_in)}, {"tokenOut", to_hex(token_out)},
                     {"amountIn", amount_in.str()}, {"amountOut", amount_out.str()},
                     {"amountSupplied", amount_out.str()}});
        Logger::info("swap router: {} supplied {} to {}", to_hex(caller), amount_out.str(), to_hex(market));
    });
}

// =============================================================================
// Repay
// =============================================================================

void SwapRouter::swap_and_repay(const Address& caller, const Address& market, const Address& token_in,
                                const U256& amount_in, const U256& min_amount_out,
                                const SwapInstructions& swap) {
    chain_.transact([&] {
        TransientSlot<Address>::Scope scope(lock_, caller);
        validate(market, amount_in);

        U256 debt = comptroller_.borrow_balance_current(market, caller);
        if (debt == 0) throw ContractError(ErrorCode::ZeroAmount, "no debt");

        Address token_out = comptroller_.underlying(market);
        pull(token_in, caller, amount_in);
        U256 amount_out = this->swap(token_in, amount_in, token_out, swap);
        if (amount_out < min_amount_out) {
            throw ContractError(ErrorCode::InsufficientAmountOut, amount_out.str() + " < " + min_amount_out.str());
        }

        U256 repaid = std::min(amount_out, debt);
        repay(caller, market, repaid);
        refund(token_out, caller, amount_out - repaid);

        chain_.emit(self_, "SwapAndRepay",
                    {{"user", to_hex(caller)}, {"vToken", to_hex(market)},
                     {"tokenIn", to_hex(token_in)}, {"tokenOut", to_hex(token_out)},
                     {"amountIn", amount_in.str()}, {"amountOut", amount_out.str()},
                     {"amountRepaid", repaid.str()}});
        Logger::info("swap router: {} repaid {} on {}", to_hex(caller), repaid.str(), to_hex(market));
    });
}

void SwapRouter::swap_and_repay_full(const Address& caller, const Address& market, const Address& token_in,
                                     const U256& amount_in, const SwapInstructions& swap) {
    chain_.transact([&] {
        TransientSlot<Address>::Scope scope(lock_, caller);
        validate(market, amount_in);

        U256 debt = comptroller_.borrow_balance_current(market, caller);
        if (debt == 0) throw ContractError(ErrorCode::ZeroAmount, "no debt");

        Address token_out = comptroller_.underlying(market);
        pull(token_in, caller, amount_in);
        U256 amount_out = this->swap(token_in, amount_in, token_out, swap);
        if (amount_out < debt) {
            throw ContractError(ErrorCode::InsufficientAmountOut, amount_out.str() + " < " + debt.str());
        }

        repay(caller, market, debt);
        refund(token_out, caller, amount_out - debt);

        chain_.emit(self_, "SwapAndRepay",
                    {{"user", to_hex(caller)}, {"vToken", to_hex(market)},
                     {"tokenIn", to_hex(token_in)}, {"tokenOut", to_hex(token_out)},
                     {"amountIn", amount_in.str()}, {"amountOut", amount_out.str()},
                     {"amountRepaid", debt.str()}});
        Logger::info("swap router: {} repaid full debt {} on {}", to_hex(caller), debt.str(), to_hex(market));
    });
}

// =============================================================================
// Administration
// =============================================================================

void SwapRouter::sweep_token(const Address& caller, const Address& token) {
    chain_.transact([&] {
        if (caller != owner_) throw ContractError(ErrorCode::Unauthorized, caller);

        U256 amount = balance(token);
        if (amount > 0) tokens_.transfer(self_, token, owner_, amount);
        chain_.emit(self_, "SweepToken",
                    {{"token", to_hex(token)}, {"receiver", to_hex(owner_)}, {"amount", amount.str()}});
    });
}

// =============================================================================
// Steps
// =============================================================================

void SwapRouter::validate(const Address& market, const U256& amount_in) const {
    if (amount_in == 0) throw ContractError(ErrorCode::ZeroAmount);
    if (!comptroller_.is_listed(market)) throw ContractError(ErrorCode::MarketNotListed, market);
    if (market == native_market_) throw ContractError(ErrorCode::VBNBNotSupported, market);
}

void SwapRouter::pull(const Address& token, const Address& from, const U256& amount) {
    U256 held = tokens_.balance_of(token, from);
    if (held < amount) {
        throw ContractError(ErrorCode::InsufficientBalance, "holds " + held.str() + ", needs " + amount.str());
    }
    tokens_.transfer_from(self_, token, from, self_, amount);
}

U256 SwapRouter::swap(const Address& token_in, const U256& amount_in, const Address& token_out,
                      const SwapInstructions& instructions) {
    if (token_in == token_out) return amount_in;

    U256 before = balance(token_out);
    tokens_.transfer(self_, token_in, converter_.address(), amount_in);

    try {
        converter_.multicall(self_, instructions);
    } catch (const std::exception& e) {
        Logger::warning("swap router: token converter reverted: {}", e.what());
        throw ContractError(ErrorCode::TokenSwapCallFailed, e.what());
    }

    U256 after = balance(token_out);
    if (after <= before) throw ContractError(ErrorCode::TokenSwapCallFailed, "no output");
    return after - before;
}

void SwapRouter::repay(const Address& borrower, const Address& market, const U256& amount) {
    tokens_.approve(self_, comptroller_.underlying(market), market, amount);
    uint32_t code = comptroller_.repay_borrow_behalf(self_, borrower, market, amount);
    if (code != market_errors::OK) throw ContractError(ErrorCode::RepayBehalfFailed, code_detail(code));
}

void SwapRouter::refund(const Address& token, const Address& to, const U256& amount) {
    if (amount == 0) return;
    tokens_.transfer(self_, token, to, amount);
    chain_.emit(self_, "Refund", {{"user", to_hex(to)}, {"token", to_hex(token)}, {"amount", amount.str()}});
}

U256 SwapRouter::balance(const Address& token) const {
    return tokens_.balance_of(token, self_);
}

} // namespace lever
