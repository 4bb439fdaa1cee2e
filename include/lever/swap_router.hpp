#ifndef LEVER_SWAP_ROUTER_HPP
#define LEVER_SWAP_ROUTER_HPP

#include "chain.hpp"
#include "converter.hpp"
#include "market.hpp"
#include "token.hpp"
#include "transient.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// SwapRouter
//
// Converts a token the caller holds into a market's underlying through the
// token converter, then supplies it or repays the caller's debt with it in
// the same transaction. Output is measured by balance delta and checked
// against the caller's minimum. Whatever a repayment does not use goes back
// to the caller.
// =============================================================================

class SwapRouter {
public:
    SwapRouter(Chain& chain, TokenLedger& tokens, IMarketService& comptroller, ITokenConverter& converter,
               const Address& native_market, const Address& owner);

    // Non-copyable
    SwapRouter(const SwapRouter&) = delete;
    SwapRouter& operator=(const SwapRouter&) = delete;

    Address address() const { return self_; }
    const Address& owner() const { return owner_; }

    void swap_and_supply(const Address& caller, const Address& market, const Address& token_in,
                         const U256& amount_in, const U256& min_amount_out, const SwapInstructions& swap);

    // Repays min(amount out, debt) and refunds the rest
    void swap_and_repay(const Address& caller, const Address& market, const Address& token_in,
                        const U256& amount_in, const U256& min_amount_out, const SwapInstructions& swap);

    // Reverts InsufficientAmountOut unless the swap covers the whole debt
    void swap_and_repay_full(const Address& caller, const Address& market, const Address& token_in,
                             const U256& amount_in, const SwapInstructions& swap);

    // Owner only; sends the router's whole balance of token to the owner
    void sweep_token(const Address& caller, const Address& token);

private:
    void validate(const Address& market, const U256& amount_in) const;
    void pull(const Address& token, const Address& from, const U256& amount);
    U256 swap(const Address& token_in, const U256& amount_in, const Address& token_out,
              const SwapInstructions& instructions);
    void repay(const Address& borrower, const Address& market, const U256& amount);
    void refund(const Address& token, const Address& to, const U256& amount);
    U256 balance(const Address& token) const;

    Chain& chain_;
    TokenLedger& tokens_;
    IMarketService& comptroller_;
    ITokenConverter& converter_;
    Address native_market_;
    Address owner_;
    Address self_;
    TransientSlot<Address> lock_;
};

} // namespace lever

#endif // LEVER_SWAP_ROUTER_HPP
