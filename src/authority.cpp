#include "authority.hpp"

#include "errors.hpp"

#include <sodium.h>

namespace dp {

void AuthorityGuard::require(const AccountId& caller, const std::string& operation) const {
    if (!isAuthority(caller)) {
        throw UnauthorizedError("Caller '" + caller + "' is not permitted to " + operation);
    }
}

IdentityAuthority::IdentityAuthority(AccountId authority) : authority_(std::move(authority)) {
    if (sodium_init() < 0) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    if (authority_.empty()) {
        throw InvalidConfigurationError("Authority identity must not be empty");
    }
}

bool IdentityAuthority::isAuthority(const AccountId& caller) const {
    if (caller.size() != authority_.size()) {
        return false;
    }
    return sodium_memcmp(caller.data(), authority_.data(), authority_.size()) == 0;
}

void IdentityAuthority::reassign(const AccountId& newAuthority) {
    if (newAuthority.empty()) {
        throw InvalidConfigurationError("Authority identity must not be empty");
    }
    authority_ = newAuthority;
}

} // namespace dp
