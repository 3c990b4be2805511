#pragma once

#include "amount.hpp"
#include "round.hpp"

#include <cstdint>

namespace dp {

constexpr std::uint32_t kMaxFeePercent = 100;

struct EngineConfig {
    AccountId authority;
    Amount minStake = 0;          // bids must strictly exceed this
    std::uint32_t feePercent = 5; // retained from every bid, truncating
};

// Throws InvalidConfigurationError.
void validateConfig(const EngineConfig& cfg);

// Overrides from DP_AUTHORITY, DP_MIN_STAKE and DP_FEE_PERCENT, then validates.
EngineConfig loadEngineConfigFromEnv(EngineConfig base = {});

} // namespace dp
