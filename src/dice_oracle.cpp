#include "dice_oracle.hpp"

#include <stdexcept>
#include <string>

#include <sodium.h>

namespace dp {

ScriptedDiceOracle::ScriptedDiceOracle(std::vector<DiceRoll> rolls) : rolls_(std::move(rolls)) {}

DiceRoll ScriptedDiceOracle::roll(RoundId roundId) {
    if (next_ >= rolls_.size()) {
        throw std::runtime_error("Scripted dice exhausted at round " + std::to_string(roundId));
    }
    return rolls_[next_++];
}

SodiumDiceOracle::SodiumDiceOracle() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
}

DiceRoll SodiumDiceOracle::roll(RoundId roundId) {
    (void)roundId;
    DiceRoll out;
    for (auto& value : out.values) {
        value = kMinDieValue + static_cast<int>(randombytes_uniform(kMaxDieValue));
    }
    return out;
}

} // namespace dp
