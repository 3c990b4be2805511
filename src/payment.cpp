#include "payment.hpp"

#include <stdexcept>

namespace dp {

void InMemoryLedger::executeBatch(const std::vector<Payment>& batch) {
    std::map<AccountId, Amount> staged = balances_;
    for (const auto& payment : batch) {
        if (payment.recipient.empty()) {
            throw std::runtime_error("Payment recipient must not be empty");
        }
        if (payment.amount == 0) {
            throw std::runtime_error("Payment amount must be positive");
        }
        if (blocked_.count(payment.recipient) != 0) {
            throw std::runtime_error("Recipient account is blocked: " + payment.recipient);
        }
        staged[payment.recipient] += payment.amount;
    }

    balances_ = std::move(staged);
    history_.insert(history_.end(), batch.begin(), batch.end());
    ++batchCount_;
}

Amount InMemoryLedger::balanceOf(const AccountId& account) const {
    auto it = balances_.find(account);
    if (it == balances_.end()) {
        return Amount(0);
    }
    return it->second;
}

const char* toString(PaymentKind kind) {
    switch (kind) {
    case PaymentKind::Refund:
        return "refund";
    case PaymentKind::Payout:
        return "payout";
    case PaymentKind::Withdrawal:
        return "withdrawal";
    }
    return "unknown";
}

} // namespace dp
