// =============================================================================
// position_swapper.cpp - Position Swapper (collateral and debt migration)
// =============================================================================

#include "lever/position_swapper.hpp"

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

PositionSwapper::PositionSwapper(Chain& chain, TokenLedger& tokens, IMarketService& comptroller,
                                 const Address& owner)
    : chain_(chain),
      tokens_(tokens),
      comptroller_(comptroller),
      owner_(owner),
      self_(chain.create_address("PositionSwapper")),
      approved_pairs_(chain) {
    if (is_zero(comptroller.address()) || is_zero(owner)) throw ContractError(ErrorCode::ZeroAddress);
}

// =============================================================================
// Administration
// =============================================================================

void PositionSwapper::set_approved_pair(const Address& caller, const Address& market_from,
                                        const Address& market_to, const Address& converter, bool approved) {
    chain_.transact([&] {
        if (caller != owner_) throw ContractError(ErrorCode::Unauthorized, caller);
        if (is_zero(market_from) || is_zero(market_to) || is_zero(converter)) {
            throw ContractError(ErrorCode::ZeroAddress);
        }

        Pair pair{market_from, market_to, converter};
        if (approved) {
            approved_pairs_->insert(pair);
        } else {
            approved_pairs_->erase(pair);
        }
        chain_.emit(self_, "ApprovedPairUpdated",
                    {{"marketFrom", to_hex(market_from)}, {"marketTo", to_hex(market_to)},
                     {"helper", to_hex(converter)}, {"approved", approved}});
    });
}

bool PositionSwapper::is_pair_approved(const Address& market_from, const Address& market_to,
                                       const Address& converter) const {
    return chain_.read([&] { return approved_pairs_.get().count(Pair{market_from, market_to, converter}) != 0; });
}

void PositionSwapper::sweep_token(const Address& caller, const Address& token) {
    chain_.transact([&] {
        if (caller != owner_) throw ContractError(ErrorCode::Unauthorized, caller);

        U256 amount = balance(token);
        if (amount > 0) tokens_.transfer(self_, token, owner_, amount);
        chain_.emit(self_, "SweepToken",
                    {{"token", to_hex(token)}, {"receiver", to_hex(owner_)}, {"amount", amount.str()}});
    });
}

// =============================================================================
// Collateral
// =============================================================================

void PositionSwapper::swap_full_collateral(const Address& caller, const Address& user, const Address& market_from,
                                           const Address& market_to, ITokenConverter& converter,
                                           const SwapInstructions& swap) {
    chain_.transact([&] {
        U256 shares = comptroller_.balance_of(market_from, user);
        if (shares == 0) throw ContractError(ErrorCode::NoVTokenBalance, user);
        swap_collateral(caller, user, market_from, market_to, shares, converter, swap);
    });
}

void PositionSwapper::swap_collateral_with_amount(const Address& caller, const Address& user,
                                                  const Address& market_from, const Address& market_to,
                                                  const U256& shares, ITokenConverter& converter,
                                                  const SwapInstructions& swap) {
    chain_.transact([&] {
        if (shares == 0) throw ContractError(ErrorCode::ZeroAmount);
        swap_collateral(caller, user, market_from, market_to, shares, converter, swap);
    });
}

void PositionSwapper::swap_collateral(const Address& caller, const Address& user, const Address& market_from,
                                      const Address& market_to, const U256& shares, ITokenConverter& converter,
                                      const SwapInstructions& swap) {
    TransientSlot<Address>::Scope scope(lock_, user);
    validate(caller, user, market_from, market_to, converter);

    U256 held = comptroller_.balance_of(market_from, user);
    if (held == 0 || shares > held) {
        throw ContractError(ErrorCode::NoVTokenBalance, held.str() + " < " + shares.str());
    }

    accrue(market_from);
    accrue(market_to);
    bool was_collateral = false;
    for (const auto& market : comptroller_.assets_in(user)) was_collateral = was_collateral || market == market_from;

    uint32_t code = comptroller_.seize(self_, market_from, user, self_, shares);
    if (code != market_errors::OK) throw ContractError(ErrorCode::SeizeFailed, code_detail(code));

    Address token_from = comptroller_.underlying(market_from);
    Address token_to = comptroller_.underlying(market_to);
    U256 before = balance(token_from);
    code = comptroller_.redeem_behalf(self_, self_, market_from, shares);
    if (code != market_errors::OK) throw ContractError(ErrorCode::RedeemBehalfFailed, code_detail(code));
    U256 redeemed = balance(token_from) - before;

    U256 received = convert(converter, token_from, redeemed, token_to, swap);

    tokens_.approve(self_, token_to, market_to, received);
    code = comptroller_.mint_behalf(self_, user, market_to, received);
    if (code != market_errors::OK) throw ContractError(ErrorCode::MintBehalfFailed, code_detail(code));

    std::vector<Address> assets = comptroller_.assets_in(user);
    if (was_collateral && std::find(assets.begin(), assets.end(), market_to) == assets.end()) {
        code = comptroller_.enter_market_behalf(self_, user, market_to);
        if (code != market_errors::OK) throw ContractError(ErrorCode::EnterMarketFailed, code_detail(code));
    }

    check_solvency(user);

    chain_.emit(self_, "CollateralSwapped",
                {{"user", to_hex(user)}, {"marketFrom", to_hex(market_from)}, {"marketTo", to_hex(market_to)},
                 {"amountSeized", shares.str()}, {"amountReceived", received.str()}});
    Logger::info("position swapper: moved collateral of {} from {} to {}", to_hex(user), to_hex(market_from),
                 to_hex(market_to));
}

// =============================================================================
// Debt
// =============================================================================

void PositionSwapper::swap_full_debt(const Address& caller, const Address& user, const Address& market_from,
                                     const Address& market_to, const U256& borrow_amount,
                                     ITokenConverter& converter, const SwapInstructions& swap) {
    chain_.transact([&] {
        U256 debt = comptroller_.borrow_balance_current(market_from, user);
        if (debt == 0) throw ContractError(ErrorCode::NoBorrowBalance, user);
        swap_debt(caller, user, market_from, market_to, debt, borrow_amount, converter, swap);
    });
}

void PositionSwapper::swap_debt_with_amount(const Address& caller, const Address& user,
                                            const Address& market_from, const Address& market_to,
                                            const U256& repay_amount, const U256& borrow_amount,
                                            ITokenConverter& converter, const SwapInstructions& swap) {
    chain_.transact([&] {
        if (repay_amount == 0) throw ContractError(ErrorCode::ZeroAmount);
        swap_debt(caller, user, market_from, market_to, repay_amount, borrow_amount, converter, swap);
    });
}

void PositionSwapper::swap_debt(const Address& caller, const Address& user, const Address& market_from,
                                const Address& market_to, const U256& repay_amount, const U256& borrow_amount,
                                ITokenConverter& converter, const SwapInstructions& swap) {
    TransientSlot<Address>::Scope scope(lock_, user);
    validate(caller, user, market_from, market_to, converter);
    if (borrow_amount == 0) throw ContractError(ErrorCode::ZeroAmount);

    accrue(market_from);
    accrue(market_to);
    U256 debt = comptroller_.borrow_balance_current(market_from, user);
    if (debt == 0 || repay_amount > debt) {
        throw ContractError(ErrorCode::NoBorrowBalance, debt.str() + " < " + repay_amount.str());
    }

    uint32_t code = comptroller_.borrow_behalf(self_, user, market_to, borrow_amount);
    if (code != market_errors::OK) throw ContractError(ErrorCode::BorrowBehalfFailed, code_detail(code));

    Address token_from = comptroller_.underlying(market_from);
    Address token_to = comptroller_.underlying(market_to);
    U256 received = convert(converter, token_to, borrow_amount, token_from, swap);
    if (received < repay_amount) {
        throw ContractError(ErrorCode::InsufficientAmountOut, received.str() + " < " + repay_amount.str());
    }

    tokens_.approve(self_, token_from, market_from, repay_amount);
    code = comptroller_.repay_borrow_behalf(self_, user, market_from, repay_amount);
    if (code != market_errors::OK) throw ContractError(ErrorCode::RepayBehalfFailed, code_detail(code));

    // Conversion surplus belongs to the account
    U256 surplus = received - repay_amount;
    if (surplus > 0) tokens_.transfer(self_, token_from, user, surplus);

    check_solvency(user);

    chain_.emit(self_, "DebtSwapped",
                {{"user", to_hex(user)}, {"marketFrom", to_hex(market_from)}, {"marketTo", to_hex(market_to)},
                 {"amountRepaid", repay_amount.str()}, {"amountBorrowed", borrow_amount.str()}});
    Logger::info("position swapper: moved debt of {} from {} to {}", to_hex(user), to_hex(market_from),
                 to_hex(market_to));
}

// =============================================================================
// Steps
// =============================================================================

void PositionSwapper::validate(const Address& caller, const Address& user, const Address& market_from,
                               const Address& market_to, const ITokenConverter& converter) const {
    if (caller != user && !comptroller_.approved_delegates(user, caller)) {
        throw ContractError(ErrorCode::Unauthorized, caller);
    }
    if (!comptroller_.is_listed(market_from)) throw ContractError(ErrorCode::MarketNotListed, market_from);
    if (!comptroller_.is_listed(market_to)) throw ContractError(ErrorCode::MarketNotListed, market_to);
    if (market_from == market_to) throw ContractError(ErrorCode::IdenticalMarkets);
    if (approved_pairs_.get().count(Pair{market_from, market_to, converter.address()}) == 0) {
        throw ContractError(ErrorCode::PairNotApproved, converter.address());
    }
}

void PositionSwapper::accrue(const Address& market) {
    uint32_t code = comptroller_.accrue_interest(market);
    if (code != market_errors::OK) throw ContractError(ErrorCode::AccrueInterestFailed, code_detail(code));
}

U256 PositionSwapper::convert(ITokenConverter& converter, const Address& token_in, const U256& amount_in,
                              const Address& token_out, const SwapInstructions& instructions) {
    if (token_in == token_out) return amount_in;

    U256 before = balance(token_out);
    if (amount_in > 0) tokens_.transfer(self_, token_in, converter.address(), amount_in);

    try {
        converter.multicall(self_, instructions);
    } catch (const std::exception& e) {
        Logger::warning("position swapper: token converter reverted: {}", e.what());
        throw ContractError(ErrorCode::TokenSwapCallFailed, e.what());
    }

    U256 after = balance(token_out);
    if (after <= before) throw ContractError(ErrorCode::TokenSwapCallFailed, "no output");
    return after - before;
}

void PositionSwapper::check_solvency(const Address& user) {
    for (const auto& market : comptroller_.assets_in(user)) accrue(market);

    AccountLiquidity liquidity = comptroller_.get_account_liquidity(user);
    if (liquidity.error != market_errors::OK || liquidity.shortfall > 0) {
        throw ContractError(ErrorCode::SwapCausesLiquidation,
                            "error " + std::to_string(liquidity.error) + ", shortfall " + liquidity.shortfall.str());
    }
}

U256 PositionSwapper::balance(const Address& token) const {
    return tokens_.balance_of(token, self_);
}

} // namespace lever
