#pragma once

#include "amount.hpp"
#include "round.hpp"

#include <map>
#include <memory>
#include <set>
#include <vector>

namespace dp {

enum class PaymentKind { Refund, Payout, Withdrawal };

struct Payment {
    AccountId recipient;
    Amount amount;
    PaymentKind kind = PaymentKind::Payout;
    RoundId roundId = 0;
    BidId bidId = 0;
};

// Outbound fund transfer. A batch either settles in full or throws and settles nothing.
class PaymentGateway {
public:
    virtual ~PaymentGateway() = default;
    virtual void executeBatch(const std::vector<Payment>& batch) = 0;
};

using PaymentGatewayPtr = std::shared_ptr<PaymentGateway>;

// Credits recipients in process memory. Blocked accounts make any batch touching them fail.
class InMemoryLedger : public PaymentGateway {
public:
    void executeBatch(const std::vector<Payment>& batch) override;

    Amount balanceOf(const AccountId& account) const;
    void blockAccount(const AccountId& account) { blocked_.insert(account); }
    void unblockAccount(const AccountId& account) { blocked_.erase(account); }

    const std::vector<Payment>& history() const { return history_; }
    std::size_t batchCount() const { return batchCount_; }

private:
    std::map<AccountId, Amount> balances_;
    std::set<AccountId> blocked_;
    std::vector<Payment> history_;
    std::size_t batchCount_ = 0;
};

const char* toString(PaymentKind kind);

} // namespace dp
