#ifndef LEVER_TOKEN_HPP
#define LEVER_TOKEN_HPP

#include <map>
#include <string>
#include <utility>

#include "chain.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Token State (ERC-20 balances and allowances)
// =============================================================================

struct TokenInfo {
    std::string symbol;
    uint8_t decimals = 18;
    U256 total_supply;
    std::map<Address, U256> balances;
    std::map<std::pair<Address, Address>, U256> allowances;  // (owner, spender)
};

// =============================================================================
// TokenLedger - registry of simulated ERC-20 tokens
// =============================================================================

class TokenLedger {
public:
    explicit TokenLedger(Chain& chain);
    ~TokenLedger() = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    Address create_token(const std::string& symbol, uint8_t decimals);

    bool exists(const Address& token) const;
    uint8_t decimals(const Address& token) const;
    std::string symbol(const Address& token) const;
    U256 total_supply(const Address& token) const;
    U256 balance_of(const Address& token, const Address& account) const;
    U256 allowance(const Address& token, const Address& owner, const Address& spender) const;

    void transfer(const Address& caller, const Address& token, const Address& to, const U256& amount);

    // Consumes allowance unless it is MAX_U256
    void transfer_from(const Address& caller, const Address& token, const Address& from,
                       const Address& to, const U256& amount);

    void approve(const Address& caller, const Address& token, const Address& spender, const U256& amount);

    // Faucet
    void mint(const Address& token, const Address& to, const U256& amount);

private:
    TokenInfo& token_mut(const Address& token);
    const TokenInfo& token_ref(const Address& token) const;
    void move(TokenInfo& info, const Address& token, const Address& from, const Address& to, const U256& amount);

    Chain& chain_;
    Storage<std::map<Address, TokenInfo>> tokens_;
};

} // namespace lever

#endif // LEVER_TOKEN_HPP
