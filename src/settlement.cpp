#include "settlement.hpp"

#include <algorithm>
#include <stdexcept>

namespace dp {

EqualizationPlan equalize(const Amount& bigPoolTotal,
                          const Amount& smallPoolTotal,
                          const std::map<BidId, Bid>& bids) {
    EqualizationPlan plan;
    plan.bigPoolTotal = bigPoolTotal;
    plan.smallPoolTotal = smallPoolTotal;
    if (bigPoolTotal == smallPoolTotal) {
        return plan;
    }

    const Side heavySide = bigPoolTotal > smallPoolTotal ? Side::BigNumber : Side::SmallNumber;
    const Amount deficit = heavySide == Side::BigNumber ? bigPoolTotal - smallPoolTotal
                                                        : smallPoolTotal - bigPoolTotal;
    if (heavySide == Side::BigNumber) {
        plan.bigPoolTotal = smallPoolTotal;
    } else {
        plan.smallPoolTotal = bigPoolTotal;
    }

    Amount remaining = deficit;
    for (auto it = bids.rbegin(); it != bids.rend() && remaining > 0; ++it) {
        const Bid& bid = it->second;
        if (bid.side != heavySide) {
            continue;
        }
        Amount refund = std::min(remaining, bid.stake);
        if (refund == 0) {
            continue;
        }
        remaining -= refund;
        plan.adjustedStakes[bid.id] = bid.stake - refund;
        plan.refunds.push_back({ bid.id, bid.bettor, refund });
    }

    if (remaining != 0) {
        throw std::runtime_error("Heavy-side stakes cannot absorb the pool deficit of " +
                                 formatAmount(deficit));
    }
    return plan;
}

std::vector<Payout> computePayouts(RoundResult result, const std::map<BidId, Bid>& bids) {
    if (result == RoundResult::Undetermined) {
        throw std::runtime_error("Cannot compute payouts before the roll is classified");
    }

    std::vector<Payout> payouts;
    payouts.reserve(bids.size());
    for (const auto& [id, bid] : bids) {
        Payout payout{ id, bid.bettor, Amount(0), false };
        if (sideWins(bid.side, result)) {
            payout.amount = bid.stake * 2;
            payout.won = true;
        }
        payouts.push_back(std::move(payout));
    }
    return payouts;
}

Amount sumStakes(const std::map<BidId, Bid>& bids, Side side) {
    Amount total;
    for (const auto& [id, bid] : bids) {
        (void)id;
        if (bid.side == side) {
            total += bid.stake;
        }
    }
    return total;
}

} // namespace dp
