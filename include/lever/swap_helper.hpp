#ifndef LEVER_SWAP_HELPER_HPP
#define LEVER_SWAP_HELPER_HPP

#include <set>
#include <string>

#include "chain.hpp"
#include "converter.hpp"
#include "token.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// SwapHelper - signature gated multicall executor holding swap inventory
// =============================================================================

class SwapHelper : public ITokenConverter {
public:
    SwapHelper(Chain& chain, TokenLedger& tokens, const Address& backend_signer);

    // Non-copyable
    SwapHelper(const SwapHelper&) = delete;
    SwapHelper& operator=(const SwapHelper&) = delete;

    Address address() const override { return self_; }
    const Address& backend_signer() const { return backend_signer_; }

    // Reverts DeadlineReached, Unauthorized or SaltAlreadyUsed; the batch is atomic
    void multicall(const Address& caller, const SwapInstructions& instructions) override;

    void sweep(const Address& caller, const Address& token, const Address& to);
    void approve_max(const Address& caller, const Address& token, const Address& spender);

    bool salt_used(const std::string& salt) const;

private:
    void execute(const SweepCall& call);
    void execute(const ApproveMaxCall& call);
    void execute(const ExchangeCall& call);

    Chain& chain_;
    TokenLedger& tokens_;
    Address self_;
    Address backend_signer_;
    Storage<std::set<std::string>> used_salts_;
};

} // namespace lever

#endif // LEVER_SWAP_HELPER_HPP
