#ifndef LEVER_ACCESS_HPP
#define LEVER_ACCESS_HPP

#include <set>
#include <string>
#include <tuple>

#include "chain.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// AccessControlManager - (contract, function signature) -> allowed accounts
// A permission on the zero contract address applies to every contract.
// =============================================================================

class AccessControlManager {
public:
    AccessControlManager(Chain& chain, const Address& admin);
    ~AccessControlManager() = default;

    // Non-copyable
    AccessControlManager(const AccessControlManager&) = delete;
    AccessControlManager& operator=(const AccessControlManager&) = delete;

    const Address& address() const { return self_; }
    const Address& admin() const { return admin_; }

    void give_call_permission(const Address& caller, const Address& contract,
                              const std::string& signature, const Address& account);
    void revoke_call_permission(const Address& caller, const Address& contract,
                                const std::string& signature, const Address& account);

    bool is_allowed_to_call(const Address& account, const Address& contract,
                            const std::string& signature) const;

    // Throws ContractError(Unauthorized) when not allowed
    void check_access(const Address& account, const Address& contract,
                      const std::string& signature) const;

private:
    using Permission = std::tuple<Address, std::string, Address>;  // contract, signature, account

    Chain& chain_;
    Address self_;
    Address admin_;
    Storage<std::set<Permission>> permissions_;
};

} // namespace lever

#endif // LEVER_ACCESS_HPP
