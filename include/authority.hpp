#pragma once

#include "round.hpp"

#include <memory>
#include <string>

namespace dp {

// Capability check for privileged operations. Injected into the round manager.
class AuthorityGuard {
public:
    virtual ~AuthorityGuard() = default;

    virtual bool isAuthority(const AccountId& caller) const = 0;
    virtual void reassign(const AccountId& newAuthority) = 0;
    virtual AccountId current() const = 0;

    // Throws UnauthorizedError naming the rejected operation.
    void require(const AccountId& caller, const std::string& operation) const;
};

using AuthorityGuardPtr = std::shared_ptr<AuthorityGuard>;

// Single privileged identity, compared in constant time.
class IdentityAuthority : public AuthorityGuard {
public:
    explicit IdentityAuthority(AccountId authority);

    bool isAuthority(const AccountId& caller) const override;
    void reassign(const AccountId& newAuthority) override;
    AccountId current() const override { return authority_; }

private:
    AccountId authority_;
};

} // namespace dp
