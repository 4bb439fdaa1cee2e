#ifndef LEVER_POSITION_SWAPPER_HPP
#define LEVER_POSITION_SWAPPER_HPP

#include <set>
#include <tuple>

#include "chain.hpp"
#include "converter.hpp"
#include "market.hpp"
#include "token.hpp"
#include "transient.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// PositionSwapper
//
// Moves an account's collateral or debt from one market to another through
// an approved converter. Collateral is seized from the source market,
// redeemed, converted and supplied to the target market on the account's
// behalf; debt is borrowed in the target market, converted and repaid in the
// source market. The caller must be the account or one of its approved
// delegates, the swapper must be a delegate of the account and a whitelisted
// executor of the market service, and the account must be solvent afterwards.
// =============================================================================

class PositionSwapper {
public:
    PositionSwapper(Chain& chain, TokenLedger& tokens, IMarketService& comptroller, const Address& owner);

    // Non-copyable
    PositionSwapper(const PositionSwapper&) = delete;
    PositionSwapper& operator=(const PositionSwapper&) = delete;

    Address address() const { return self_; }
    const Address& owner() const { return owner_; }

    // Owner only
    void set_approved_pair(const Address& caller, const Address& market_from, const Address& market_to,
                           const Address& converter, bool approved);
    bool is_pair_approved(const Address& market_from, const Address& market_to, const Address& converter) const;

    // =========================================================================
    // Collateral
    // =========================================================================

    void swap_full_collateral(const Address& caller, const Address& user, const Address& market_from,
                              const Address& market_to, ITokenConverter& converter, const SwapInstructions& swap);

    // `shares` are market_from shares of the account
    void swap_collateral_with_amount(const Address& caller, const Address& user, const Address& market_from,
                                     const Address& market_to, const U256& shares, ITokenConverter& converter,
                                     const SwapInstructions& swap);

    // =========================================================================
    // Debt
    // =========================================================================

    // borrow_amount of market_to's underlying is borrowed and converted; the
    // proceeds must cover the whole market_from debt
    void swap_full_debt(const Address& caller, const Address& user, const Address& market_from,
                        const Address& market_to, const U256& borrow_amount, ITokenConverter& converter,
                        const SwapInstructions& swap);

    void swap_debt_with_amount(const Address& caller, const Address& user, const Address& market_from,
                               const Address& market_to, const U256& repay_amount, const U256& borrow_amount,
                               ITokenConverter& converter, const SwapInstructions& swap);

    // Owner only; sends the swapper's whole balance of token to the owner
    void sweep_token(const Address& caller, const Address& token);

private:
    using Pair = std::tuple<Address, Address, Address>;  // (from, to, converter)

    void swap_collateral(const Address& caller, const Address& user, const Address& market_from,
                         const Address& market_to, const U256& shares, ITokenConverter& converter,
                         const SwapInstructions& swap);
    void swap_debt(const Address& caller, const Address& user, const Address& market_from,
                   const Address& market_to, const U256& repay_amount, const U256& borrow_amount,
                   ITokenConverter& converter, const SwapInstructions& swap);

    void validate(const Address& caller, const Address& user, const Address& market_from,
                  const Address& market_to, const ITokenConverter& converter) const;
    void accrue(const Address& market);
    U256 convert(ITokenConverter& converter, const Address& token_in, const U256& amount_in,
                 const Address& token_out, const SwapInstructions& instructions);
    void check_solvency(const Address& user);
    U256 balance(const Address& token) const;

    Chain& chain_;
    TokenLedger& tokens_;
    IMarketService& comptroller_;
    Address owner_;
    Address self_;
    Storage<std::set<Pair>> approved_pairs_;
    TransientSlot<Address> lock_;
};

} // namespace lever

#endif // LEVER_POSITION_SWAPPER_HPP
