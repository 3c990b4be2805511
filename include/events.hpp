#pragma once

#include "amount.hpp"
#include "round.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace dp {

struct RoundCreated {
    RoundId roundId = 0;
};

struct BidPlaced {
    BidId bidId = 0;
    RoundId roundId = 0;
    AccountId bettor;
    Amount netStake;
    Amount fee;
    Side side = Side::BigNumber;
};

struct EqualizeRefund {
    RoundId roundId = 0;
    BidId bidId = 0;
    AccountId bettor;
    Amount amount;
};

struct RoundEqualized {
    RoundId roundId = 0;
    RoundState state = RoundState::Equalized;
    Amount bigPoolTotal;
    Amount smallPoolTotal;
};

struct WinnerPaid {
    RoundId roundId = 0;
    BidId bidId = 0;
    AccountId bettor;
    Amount amount;
};

struct RoundProcessed {
    RoundId roundId = 0;
    RoundState state = RoundState::Finished;
    RoundResult result = RoundResult::Undetermined;
    DiceRoll dice;
    int totalPips = 0;
};

struct FeePercentChanged {
    std::uint32_t previous = 0;
    std::uint32_t current = 0;
};

struct MinStakeChanged {
    Amount previous;
    Amount current;
};

struct AuthorityTransferred {
    AccountId previous;
    AccountId current;
};

struct Withdrawal {
    AccountId receiver;
    Amount amount;
};

using Event = std::variant<RoundCreated,
                           BidPlaced,
                           EqualizeRefund,
                           RoundEqualized,
                           WinnerPaid,
                           RoundProcessed,
                           FeePercentChanged,
                           MinStakeChanged,
                           AuthorityTransferred,
                           Withdrawal>;

using EventListener = std::function<void(const Event&)>;

const char* eventName(const Event& event);

// Canonical little-endian layout:
// | tag u8 | fields in declaration order |
// integers are u64, amounts 32-byte big-endian, strings u64 length-prefixed.
std::string encodeEvent(const Event& event);

// Single human-readable line, e.g. "BidPlaced round=1 bid=2 bettor=alice side=big ...".
std::string describeEvent(const Event& event);

} // namespace dp
