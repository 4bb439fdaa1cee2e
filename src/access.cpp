// =============================================================================
// access.cpp - Access Control Manager
// =============================================================================

#include "lever/access.hpp"
#include "lever/error.hpp"

namespace lever {

AccessControlManager::AccessControlManager(Chain& chain, const Address& admin)
    : chain_(chain), self_(chain.create_address("AccessControlManager")), admin_(admin), permissions_(chain) {
    if (is_zero(admin)) throw ContractError(ErrorCode::ZeroAddress);
}

void AccessControlManager::give_call_permission(const Address& caller, const Address& contract,
                                                const std::string& signature, const Address& account) {
    chain_.transact([&] {
        if (caller != admin_) throw ContractError(ErrorCode::Unauthorized, caller);
        if (permissions_->emplace(contract, signature, account).second) {
            chain_.emit(self_, "PermissionGranted",
                        {{"contract", to_hex(contract)}, {"signature", signature}, {"account", to_hex(account)}});
        }
    });
}

void AccessControlManager::revoke_call_permission(const Address& caller, const Address& contract,
                                                  const std::string& signature, const Address& account) {
    chain_.transact([&] {
        if (caller != admin_) throw ContractError(ErrorCode::Unauthorized, caller);
        if (permissions_->erase(Permission{contract, signature, account}) != 0) {
            chain_.emit(self_, "PermissionRevoked",
                        {{"contract", to_hex(contract)}, {"signature", signature}, {"account", to_hex(account)}});
        }
    });
}

bool AccessControlManager::is_allowed_to_call(const Address& account, const Address& contract,
                                              const std::string& signature) const {
    return chain_.read([&] {
        return permissions_->count(Permission{contract, signature, account}) != 0 ||
               permissions_->count(Permission{ZERO_ADDRESS, signature, account}) != 0;
    });
}

void AccessControlManager::check_access(const Address& account, const Address& contract,
                                        const std::string& signature) const {
    if (!is_allowed_to_call(account, contract, signature)) {
        throw ContractError(ErrorCode::Unauthorized, to_hex(account) + ", " + signature);
    }
}

} // namespace lever
