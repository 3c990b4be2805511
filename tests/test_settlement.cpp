#include "amount.hpp"
#include "round.hpp"
#include "settlement.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "settlement_test failure: " << msg << std::endl;
    std::exit(1);
}

void expect(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

dp::Bid makeBid(dp::BidId id, const std::string& bettor, dp::Side side, std::uint64_t stake) {
    dp::Bid bid;
    bid.id = id;
    bid.bettor = bettor;
    bid.side = side;
    bid.stake = stake;
    return bid;
}

void addBid(std::map<dp::BidId, dp::Bid>& bids,
            const std::string& bettor,
            dp::Side side,
            std::uint64_t stake) {
    dp::BidId id = bids.size() + 1;
    bids.emplace(id, makeBid(id, bettor, side, stake));
}

void testMostRecentBidsAbsorbDeficit() {
    using dp::Side;
    std::map<dp::BidId, dp::Bid> bids;
    addBid(bids, "a", Side::BigNumber, 100);
    addBid(bids, "b", Side::BigNumber, 100);
    addBid(bids, "c", Side::BigNumber, 100);
    addBid(bids, "d", Side::SmallNumber, 100);

    auto plan = dp::equalize(300, 100, bids);
    expect(plan.bigPoolTotal == 100, "big pool should shrink to 100");
    expect(plan.smallPoolTotal == 100, "small pool should be unchanged");
    expect(plan.refunds.size() == 2, "expected two refunds");
    expect(plan.refunds[0].bidId == 3 && plan.refunds[0].amount == 100, "bid 3 refunded first");
    expect(plan.refunds[1].bidId == 2 && plan.refunds[1].amount == 100, "bid 2 refunded second");
    expect(plan.refunds[0].bettor == "c", "refund routed to the bettor of bid 3");
    expect(plan.adjustedStakes.count(1) == 0, "bid 1 must be untouched");
    expect(plan.adjustedStakes.at(2) == 0 && plan.adjustedStakes.at(3) == 0,
           "bids 2 and 3 drained");
}

void testPartialPeelAndLightSideSkipped() {
    using dp::Side;
    std::map<dp::BidId, dp::Bid> bids;
    addBid(bids, "early", Side::SmallNumber, 500);
    addBid(bids, "big", Side::BigNumber, 200);
    addBid(bids, "mid", Side::SmallNumber, 30);
    addBid(bids, "late", Side::SmallNumber, 20);

    // small = 550, big = 200, deficit = 350.
    auto plan = dp::equalize(200, 550, bids);
    expect(plan.smallPoolTotal == 200 && plan.bigPoolTotal == 200, "pools must match after equalize");
    expect(plan.refunds.size() == 3, "three small-side bids share the refund");
    expect(plan.refunds[0].bidId == 4 && plan.refunds[0].amount == 20, "latest bid peeled first");
    expect(plan.refunds[1].bidId == 3 && plan.refunds[1].amount == 30, "then the middle bid");
    expect(plan.refunds[2].bidId == 1 && plan.refunds[2].amount == 300, "earliest bid covers the rest");
    expect(plan.adjustedStakes.at(1) == 200, "earliest bid keeps 200");
    expect(plan.adjustedStakes.count(2) == 0, "big-side bid must be skipped");
}

void testBalancedPoolsProduceNoRefunds() {
    std::map<dp::BidId, dp::Bid> bids;
    addBid(bids, "a", dp::Side::BigNumber, 70);
    addBid(bids, "b", dp::Side::SmallNumber, 70);
    auto plan = dp::equalize(70, 70, bids);
    expect(plan.refunds.empty() && plan.adjustedStakes.empty(), "balanced pools need no refunds");
}

void testEmptyOpposingSideRefundsEverything() {
    std::map<dp::BidId, dp::Bid> bids;
    addBid(bids, "a", dp::Side::BigNumber, 40);
    addBid(bids, "b", dp::Side::BigNumber, 60);
    auto plan = dp::equalize(100, 0, bids);
    expect(plan.bigPoolTotal == 0 && plan.smallPoolTotal == 0, "both pools end at zero");
    expect(plan.refunds.size() == 2, "every heavy bid refunded");
    expect(plan.refunds[0].amount == 60 && plan.refunds[1].amount == 40, "full stakes refunded");
}

void testInconsistentPoolsRejected() {
    std::map<dp::BidId, dp::Bid> bids;
    addBid(bids, "a", dp::Side::BigNumber, 10);
    bool thrown = false;
    try {
        dp::equalize(500, 0, bids);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    expect(thrown, "pool totals larger than recorded stakes must be rejected");
}

void testPayoutsDoubleWinningStake() {
    std::map<dp::BidId, dp::Bid> bids;
    addBid(bids, "winner", dp::Side::BigNumber, 50);
    addBid(bids, "loser", dp::Side::SmallNumber, 50);

    auto payouts = dp::computePayouts(dp::RoundResult::BigNumber, bids);
    expect(payouts.size() == 2, "one payout entry per bid");
    expect(payouts[0].bidId == 1 && payouts[0].won && payouts[0].amount == 100, "winner doubled");
    expect(payouts[1].bidId == 2 && !payouts[1].won && payouts[1].amount == 0, "loser gets nothing");

    auto smallWins = dp::computePayouts(dp::RoundResult::SmallNumber, bids);
    expect(!smallWins[0].won && smallWins[1].won && smallWins[1].amount == 100,
           "small result pays the small side");

    bool thrown = false;
    try {
        dp::computePayouts(dp::RoundResult::Undetermined, bids);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    expect(thrown, "undetermined result must not produce payouts");
}

void testDiceClassification() {
    expect(dp::classifyPips(3) == dp::RoundResult::SmallNumber, "3 is small");
    expect(dp::classifyPips(10) == dp::RoundResult::SmallNumber, "10 is small");
    expect(dp::classifyPips(11) == dp::RoundResult::BigNumber, "11 is big");
    expect(dp::classifyPips(18) == dp::RoundResult::BigNumber, "18 is big");
    expect(!dp::isValidDie(0) && !dp::isValidDie(7) && dp::isValidDie(1) && dp::isValidDie(6),
           "die bounds are [1,6]");
    bool thrown = false;
    try {
        dp::classifyPips(2);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    expect(thrown, "a total of 2 is unreachable");
}

void testSumStakes() {
    std::map<dp::BidId, dp::Bid> bids;
    addBid(bids, "a", dp::Side::BigNumber, 5);
    addBid(bids, "b", dp::Side::SmallNumber, 7);
    addBid(bids, "c", dp::Side::BigNumber, 11);
    expect(dp::sumStakes(bids, dp::Side::BigNumber) == 16, "big stakes sum");
    expect(dp::sumStakes(bids, dp::Side::SmallNumber) == 7, "small stakes sum");
}

} // namespace

// Fees on amounts near the top of the range must not overflow the product.
void testPercentOfLargeAmounts() {
    expect(dp::percentOf(199, 5) == 9, "fee truncates toward zero");
    expect(dp::percentOf(100, 5) == 5, "exact fee");
    expect(dp::percentOf(0, 100) == 0, "zero amount");

    const dp::Amount top = std::numeric_limits<dp::Amount>::max();
    const dp::Amount near = top - 12345;
    for (std::uint32_t percent : { 0u, 1u, 3u, 5u, 50u, 99u, 100u }) {
        for (const dp::Amount& value : { top, near }) {
            dp::mp::cpp_int wide(value);
            wide = wide * percent / 100;
            dp::Amount fee;
            try {
                fee = dp::percentOf(value, percent);
            } catch (const std::exception& ex) {
                fail("percentOf threw on a large amount: " + std::string(ex.what()));
            }
            expect(dp::mp::cpp_int(fee) == wide,
                   "percentOf " + std::to_string(percent) + "% of " + dp::formatAmount(value));
        }
    }
    expect(dp::percentOf(top, 100) == top, "full percentage returns the amount");
}

int main() {
    testMostRecentBidsAbsorbDeficit();
    testPartialPeelAndLightSideSkipped();
    testBalancedPoolsProduceNoRefunds();
    testEmptyOpposingSideRefundsEverything();
    testInconsistentPoolsRejected();
    testPayoutsDoubleWinningStake();
    testDiceClassification();
    testSumStakes();
    testPercentOfLargeAmounts();

    std::cout << "settlement_test passed" << std::endl;
    return 0;
}
