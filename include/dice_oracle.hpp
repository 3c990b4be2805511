#pragma once

#include "round.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace dp {

// Source of already-resolved dice values for a round.
class DiceOracle {
public:
    virtual ~DiceOracle() = default;
    virtual DiceRoll roll(RoundId roundId) = 0;
};

using DiceOraclePtr = std::shared_ptr<DiceOracle>;

// Replays a fixed sequence of rolls; throws once exhausted.
class ScriptedDiceOracle : public DiceOracle {
public:
    explicit ScriptedDiceOracle(std::vector<DiceRoll> rolls);

    DiceRoll roll(RoundId roundId) override;
    std::size_t remaining() const { return rolls_.size() - next_; }

private:
    std::vector<DiceRoll> rolls_;
    std::size_t next_ = 0;
};

// libsodium-backed local roller. Not verifiable; for simulation only.
class SodiumDiceOracle : public DiceOracle {
public:
    SodiumDiceOracle();
    DiceRoll roll(RoundId roundId) override;
};

} // namespace dp
