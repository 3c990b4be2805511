#pragma once

#include "amount.hpp"
#include "round.hpp"

#include <map>
#include <vector>

namespace dp {

struct Refund {
    BidId bidId = 0;
    AccountId bettor;
    Amount amount;
};

struct EqualizationPlan {
    Amount bigPoolTotal;
    Amount smallPoolTotal;
    std::vector<Refund> refunds;          // in the order they were peeled
    std::map<BidId, Amount> adjustedStakes; // new stake for every bid that was refunded
};

struct Payout {
    BidId bidId = 0;
    AccountId bettor;
    Amount amount;
    bool won = false;
};

// Shrinks the heavier pool down to the lighter one. Heavy-side bids absorb the
// deficit most recent first, so earlier bids keep their stake.
EqualizationPlan equalize(const Amount& bigPoolTotal,
                          const Amount& smallPoolTotal,
                          const std::map<BidId, Bid>& bids);

// One entry per bid in id order. Winners receive twice their stake.
std::vector<Payout> computePayouts(RoundResult result, const std::map<BidId, Bid>& bids);

Amount sumStakes(const std::map<BidId, Bid>& bids, Side side);

} // namespace dp
