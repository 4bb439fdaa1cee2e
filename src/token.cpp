// =============================================================================
// token.cpp - Simulated ERC-20 Ledger
// =============================================================================

#include "lever/token.hpp"
#include "lever/error.hpp"

namespace lever {

TokenLedger::TokenLedger(Chain& chain) : chain_(chain), tokens_(chain) {}

Address TokenLedger::create_token(const std::string& symbol, uint8_t decimals) {
    return chain_.transact([&] {
        Address token = chain_.create_address(symbol);
        TokenInfo info;
        info.symbol = symbol;
        info.decimals = decimals;
        tokens_->emplace(token, std::move(info));
        return token;
    });
}

// =============================================================================
// Views
// =============================================================================

bool TokenLedger::exists(const Address& token) const {
    return chain_.read([&] { return tokens_->count(token) != 0; });
}

uint8_t TokenLedger::decimals(const Address& token) const {
    return chain_.read([&] { return token_ref(token).decimals; });
}

std::string TokenLedger::symbol(const Address& token) const {
    return chain_.read([&] { return token_ref(token).symbol; });
}

U256 TokenLedger::total_supply(const Address& token) const {
    return chain_.read([&] { return token_ref(token).total_supply; });
}

U256 TokenLedger::balance_of(const Address& token, const Address& account) const {
    return chain_.read([&] {
        const TokenInfo& info = token_ref(token);
        auto it = info.balances.find(account);
        return it == info.balances.end() ? U256(0) : it->second;
    });
}

U256 TokenLedger::allowance(const Address& token, const Address& owner, const Address& spender) const {
    return chain_.read([&] {
        const TokenInfo& info = token_ref(token);
        auto it = info.allowances.find({owner, spender});
        return it == info.allowances.end() ? U256(0) : it->second;
    });
}

// =============================================================================
// Transfers
// =============================================================================

void TokenLedger::transfer(const Address& caller, const Address& token, const Address& to, const U256& amount) {
    chain_.transact([&] {
        move(token_mut(token), token, caller, to, amount);
    });
}

void TokenLedger::transfer_from(const Address& caller, const Address& token, const Address& from,
                                const Address& to, const U256& amount) {
    chain_.transact([&] {
        TokenInfo& info = token_mut(token);
        U256& allowed = info.allowances[{from, caller}];
        if (allowed < amount) {
            throw ContractError(ErrorCode::InsufficientAllowance,
                                to_hex(from) + ", " + to_hex(caller) + ", " + amount.str());
        }
        if (allowed != MAX_U256) allowed -= amount;
        move(info, token, from, to, amount);
    });
}

void TokenLedger::approve(const Address& caller, const Address& token, const Address& spender, const U256& amount) {
    chain_.transact([&] {
        if (is_zero(spender)) throw ContractError(ErrorCode::ZeroAddress);
        token_mut(token).allowances[{caller, spender}] = amount;
        chain_.emit(token, "Approval", {{"owner", to_hex(caller)}, {"spender", to_hex(spender)},
                                        {"amount", amount.str()}});
    });
}

void TokenLedger::mint(const Address& token, const Address& to, const U256& amount) {
    chain_.transact([&] {
        if (is_zero(to)) throw ContractError(ErrorCode::ZeroAddress);
        TokenInfo& info = token_mut(token);
        info.total_supply += amount;
        info.balances[to] += amount;
        chain_.emit(token, "Transfer", {{"from", to_hex(ZERO_ADDRESS)}, {"to", to_hex(to)},
                                        {"amount", amount.str()}});
    });
}

// =============================================================================
// Internal
// =============================================================================

TokenInfo& TokenLedger::token_mut(const Address& token) {
    auto it = tokens_->find(token);
    if (it == tokens_->end()) throw ContractError(ErrorCode::UnknownToken, token);
    return it->second;
}

const TokenInfo& TokenLedger::token_ref(const Address& token) const {
    auto it = tokens_->find(token);
    if (it == tokens_->end()) throw ContractError(ErrorCode::UnknownToken, token);
    return it->second;
}

void TokenLedger::move(TokenInfo& info, const Address& token, const Address& from, const Address& to,
                       const U256& amount) {
    if (is_zero(to)) throw ContractError(ErrorCode::ZeroAddress);

    U256& from_balance = info.balances[from];
    if (from_balance < amount) {
        throw ContractError(ErrorCode::InsufficientBalance,
                            to_hex(from) + ", " + from_balance.str() + ", " + amount.str());
    }
    from_balance -= amount;
    info.balances[to] += amount;

    chain_.emit(token, "Transfer", {{"from", to_hex(from)}, {"to", to_hex(to)}, {"amount", amount.str()}});
}

} // namespace lever
