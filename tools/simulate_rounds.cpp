#include "config.hpp"
#include "dice_oracle.hpp"
#include "events.hpp"
#include "payment.hpp"
#include "round_manager.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include <sodium.h>

namespace {

constexpr std::uint32_t kBettorCount = 4;
constexpr std::uint32_t kMaxBidsPerRound = 8;
constexpr std::uint32_t kMaxStake = 1000;

} // namespace

int main(int argc, char* argv[]) {
    std::uint64_t rounds = 3;
    if (argc > 1) {
        try {
            rounds = std::stoull(argv[1]);
        } catch (const std::exception& ex) {
            std::cerr << "Usage: simulate_rounds [rounds]\nRound count must be an unsigned integer: "
                      << ex.what() << '\n';
            return 1;
        }
    }

    try {
        dp::EngineConfig base;
        base.authority = "house";
        dp::EngineConfig cfg = dp::loadEngineConfigFromEnv(base);

        auto ledger = std::make_shared<dp::InMemoryLedger>();
        auto oracle = std::make_shared<dp::SodiumDiceOracle>();
        dp::RoundManager engine(cfg, ledger, oracle);
        engine.setEventListener([](const dp::Event& event) {
            std::cout << "  " << dp::describeEvent(event) << '\n';
        });

        std::cout << "Authority=" << cfg.authority << " fee=" << cfg.feePercent
                  << "% minStake=" << cfg.minStake
                  << " (set DP_AUTHORITY/DP_FEE_PERCENT/DP_MIN_STAKE to override)\n";

        engine.createRound(cfg.authority);
        for (std::uint64_t i = 0; i < rounds; ++i) {
            dp::RoundId roundId = engine.getCurrentRound().id;
            std::cout << "\n=== ROUND " << roundId << " ===\n";

            std::uint32_t bids = 1 + randombytes_uniform(kMaxBidsPerRound);
            for (std::uint32_t b = 0; b < bids; ++b) {
                std::string bettor = "bettor-" + std::to_string(randombytes_uniform(kBettorCount));
                dp::Side side = randombytes_uniform(2) == 0 ? dp::Side::BigNumber : dp::Side::SmallNumber;
                dp::Amount amount = cfg.minStake + 1 + randombytes_uniform(kMaxStake);
                engine.placeBid(bettor, roundId, side, amount);
            }

            engine.equalizeBids(cfg.authority, roundId);
            engine.processRoundFromOracle(cfg.authority);
        }

        std::cout << "\nRetained balance: " << engine.getBalance() << '\n';
        for (std::uint32_t b = 0; b < kBettorCount; ++b) {
            std::string bettor = "bettor-" + std::to_string(b);
            std::cout << "  " << bettor << " received " << ledger->balanceOf(bettor) << '\n';
        }
        std::cout << "Event log root: " << engine.getEventLogRoot() << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "simulate_rounds: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
