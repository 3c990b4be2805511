#include "round.hpp"

#include <stdexcept>

namespace dp {

bool isValidDie(int value) {
    return value >= kMinDieValue && value <= kMaxDieValue;
}

RoundResult classifyPips(int totalPips) {
    if (totalPips < 3 * kMinDieValue || totalPips > 3 * kMaxDieValue) {
        throw std::runtime_error("Pip total outside the reachable range: " + std::to_string(totalPips));
    }
    return totalPips <= kMaxSmallPips ? RoundResult::SmallNumber : RoundResult::BigNumber;
}

bool sideWins(Side side, RoundResult result) {
    switch (result) {
    case RoundResult::BigNumber:
        return side == Side::BigNumber;
    case RoundResult::SmallNumber:
        return side == Side::SmallNumber;
    case RoundResult::Undetermined:
        break;
    }
    return false;
}

const char* toString(Side side) {
    switch (side) {
    case Side::BigNumber:
        return "big";
    case Side::SmallNumber:
        return "small";
    }
    return "unknown";
}

const char* toString(RoundResult result) {
    switch (result) {
    case RoundResult::Undetermined:
        return "undetermined";
    case RoundResult::BigNumber:
        return "big";
    case RoundResult::SmallNumber:
        return "small";
    }
    return "unknown";
}

const char* toString(RoundState state) {
    switch (state) {
    case RoundState::WaitingForBids:
        return "waiting-for-bids";
    case RoundState::Processing:
        return "processing";
    case RoundState::Equalizing:
        return "equalizing";
    case RoundState::Equalized:
        return "equalized";
    case RoundState::PayingWinners:
        return "paying-winners";
    case RoundState::Finished:
        return "finished";
    }
    return "unknown";
}

} // namespace dp
