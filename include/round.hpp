#pragma once

#include "amount.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <string>

namespace dp {

using RoundId = std::uint64_t;
using BidId = std::uint64_t;
using AccountId = std::string;

enum class Side { BigNumber, SmallNumber };

enum class RoundResult { Undetermined, BigNumber, SmallNumber };

// Declaration order follows the persisted state codes, not the lifecycle order.
// Lifecycle: WaitingForBids -> Equalizing -> Equalized -> Processing -> PayingWinners -> Finished.
enum class RoundState { WaitingForBids, Processing, Equalizing, Equalized, PayingWinners, Finished };

constexpr int kMinDieValue = 1;
constexpr int kMaxDieValue = 6;
constexpr int kMaxSmallPips = 10;

struct DiceRoll {
    std::array<int, 3> values{};

    int totalPips() const { return values[0] + values[1] + values[2]; }
};

struct Bid {
    BidId id = 0;
    AccountId bettor;
    Side side = Side::BigNumber;
    Amount stake;
    bool won = false;
};

struct Round {
    RoundId id = 0;
    RoundState state = RoundState::WaitingForBids;
    RoundResult result = RoundResult::Undetermined;
    DiceRoll dice;
    int totalPips = 0;
    Amount bigPoolTotal;
    Amount smallPoolTotal;
    std::map<BidId, Bid> bids; // keyed by id, so iteration is placement order
    BidId nextBidId = 1;

    Amount& poolFor(Side side) {
        return side == Side::BigNumber ? bigPoolTotal : smallPoolTotal;
    }
    const Amount& poolFor(Side side) const {
        return side == Side::BigNumber ? bigPoolTotal : smallPoolTotal;
    }
    bool isFinished() const { return state == RoundState::Finished; }
};

bool isValidDie(int value);
RoundResult classifyPips(int totalPips);
bool sideWins(Side side, RoundResult result);

const char* toString(Side side);
const char* toString(RoundResult result);
const char* toString(RoundState state);

} // namespace dp
