// =============================================================================
// swap_helper.cpp - Swap Helper (token converter)
// =============================================================================

#include "lever/swap_helper.hpp"

#include "lever/error.hpp"
#include "lever/log.hpp"

namespace lever {

SwapHelper::SwapHelper(Chain& chain, TokenLedger& tokens, const Address& backend_signer)
    : chain_(chain),
      tokens_(tokens),
      self_(chain.create_address("SwapHelper")),
      backend_signer_(backend_signer),
      used_salts_(chain) {
    if (is_zero(backend_signer)) throw ContractError(ErrorCode::ZeroAddress);
}

void SwapHelper::multicall(const Address& caller, const SwapInstructions& instructions) {
    chain_.transact([&] {
        if (chain_.now() > instructions.deadline) {
            throw ContractError(ErrorCode::DeadlineReached, std::to_string(instructions.deadline));
        }

        if (instructions.signer) {
            if (*instructions.signer != backend_signer_) {
                throw ContractError(ErrorCode::Unauthorized, *instructions.signer);
            }
            if (!used_salts_.mut().insert(instructions.salt).second) {
                throw ContractError(ErrorCode::SaltAlreadyUsed, instructions.salt);
            }
        }

        Logger::debug("swap helper: {} call(s) from {}", instructions.calls.size(), to_hex(caller));
        for (const auto& call : instructions.calls) {
            std::visit([this](const auto& c) { execute(c); }, call);
        }
    });
}

void SwapHelper::sweep(const Address& caller, const Address& token, const Address& to) {
    chain_.transact([&] {
        Logger::debug("swap helper: sweep by {}", to_hex(caller));
        execute(SweepCall{token, to});
    });
}

void SwapHelper::approve_max(const Address& caller, const Address& token, const Address& spender) {
    chain_.transact([&] {
        Logger::debug("swap helper: approve max by {}", to_hex(caller));
        execute(ApproveMaxCall{token, spender});
    });
}

bool SwapHelper::salt_used(const std::string& salt) const {
    return chain_.read([&] { return used_salts_.get().count(salt) != 0; });
}

void SwapHelper::execute(const SweepCall& call) {
    U256 balance = tokens_.balance_of(call.token, self_);
    if (balance > 0) tokens_.transfer(self_, call.token, call.to, balance);
    chain_.emit(self_, "Swept", {{"token", to_hex(call.token)}, {"to", to_hex(call.to)}, {"amount", balance.str()}});
}

void SwapHelper::execute(const ApproveMaxCall& call) {
    tokens_.approve(self_, call.token, call.spender, MAX_U256);
}

void SwapHelper::execute(const ExchangeCall& call) {
    U256 held = tokens_.balance_of(call.token_in, self_);
    if (held < call.amount_in) {
        throw ContractError(ErrorCode::InsufficientBalance, "holds " + held.str() + ", needs " + call.amount_in.str());
    }
    if (call.amount_out > 0) tokens_.transfer(self_, call.token_out, call.to, call.amount_out);

    chain_.emit(self_, "Exchanged",
                {{"tokenIn", to_hex(call.token_in)}, {"amountIn", call.amount_in.str()},
                 {"tokenOut", to_hex(call.token_out)}, {"amountOut", call.amount_out.str()},
                 {"to", to_hex(call.to)}});
}

} // namespace lever
