#include "settlement.hpp"

#include <iostream>
#include <map>
#include <string>

namespace {

void usage() {
    std::cerr << "Usage: plan_equalization <side:stake>...\n"
              << "  side is B (big) or S (small), listed in placement order, e.g. B:100 B:100 S:100\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::map<dp::BidId, dp::Bid> bids;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto colon = arg.find(':');
            if (colon != 1 || (arg[0] != 'B' && arg[0] != 'S')) {
                std::cerr << "Malformed bid \"" << arg << "\"\n";
                usage();
                return 1;
            }
            dp::Bid bid;
            bid.id = static_cast<dp::BidId>(i);
            bid.bettor = "bid-" + std::to_string(i);
            bid.side = arg[0] == 'B' ? dp::Side::BigNumber : dp::Side::SmallNumber;
            bid.stake = dp::parseAmount(arg.substr(colon + 1));
            bids.emplace(bid.id, bid);
        }

        dp::Amount big = dp::sumStakes(bids, dp::Side::BigNumber);
        dp::Amount small = dp::sumStakes(bids, dp::Side::SmallNumber);
        auto plan = dp::equalize(big, small, bids);

        std::cout << "=== POOLS ===\n";
        std::cout << "Before: big=" << big << " small=" << small << '\n';
        std::cout << "After:  big=" << plan.bigPoolTotal << " small=" << plan.smallPoolTotal << '\n';

        std::cout << "\n=== REFUNDS (most recent first) ===\n";
        if (plan.refunds.empty()) {
            std::cout << "  none\n";
        }
        for (const auto& refund : plan.refunds) {
            std::cout << "  bid " << refund.bidId << ": refund " << refund.amount << ", keeps "
                      << plan.adjustedStakes.at(refund.bidId) << '\n';
        }

        std::cout << "\n=== PAYOUTS ===\n";
        for (auto result : { dp::RoundResult::BigNumber, dp::RoundResult::SmallNumber }) {
            std::map<dp::BidId, dp::Bid> settled = bids;
            for (const auto& [bidId, stake] : plan.adjustedStakes) {
                settled.at(bidId).stake = stake;
            }
            dp::Amount total;
            for (const auto& payout : dp::computePayouts(result, settled)) {
                total += payout.amount;
            }
            std::cout << "  if " << dp::toString(result) << ": total paid " << total << '\n';
        }
    } catch (const std::exception& ex) {
        std::cerr << "plan_equalization: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
