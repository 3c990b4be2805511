#pragma once

#include "amount.hpp"
#include "authority.hpp"
#include "config.hpp"
#include "dice_oracle.hpp"
#include "event_log.hpp"
#include "events.hpp"
#include "payment.hpp"
#include "round.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dp {

struct RoundSummary {
    RoundId id = 0;
    RoundState state = RoundState::WaitingForBids;
    RoundResult result = RoundResult::Undetermined;
    DiceRoll dice;
    int totalPips = 0;
    Amount bigPoolTotal;
    Amount smallPoolTotal;
    std::vector<BidId> bidIds;
};

struct BidDetail {
    RoundId roundId = 0;
    BidId id = 0;
    AccountId bettor;
    Side side = Side::BigNumber;
    Amount stake;
    bool won = false;
    bool finished = false;
};

struct BidReceipt {
    bool success = false;
    RoundId roundId = 0;
    BidId bidId = 0;
    AccountId bettor;
    Amount netStake;
    Amount fee;
};

// Owns the single active round and the archive of finished ones.
//
// Mutating operations run one at a time. Each one is staged against a copy of the
// state it touches; its payments go to the gateway as a single batch, and nothing
// (rounds, balance, events) is committed unless that batch settles. Queries take a
// shared lock and never observe a round mid-transition.
class RoundManager {
public:
    RoundManager(EngineConfig config,
                 AuthorityGuardPtr authority,
                 PaymentGatewayPtr payments,
                 DiceOraclePtr oracle = nullptr);
    // Uses an IdentityAuthority built from config.authority.
    RoundManager(EngineConfig config, PaymentGatewayPtr payments, DiceOraclePtr oracle = nullptr);

    RoundManager(const RoundManager&) = delete;
    RoundManager& operator=(const RoundManager&) = delete;

    RoundId createRound(const AccountId& caller);
    BidReceipt placeBid(const AccountId& caller, RoundId roundId, Side side, const Amount& amount);
    void equalizeBids(const AccountId& caller, RoundId roundId);
    void processRound(const AccountId& caller, int dice1, int dice2, int dice3);
    void processRoundFromOracle(const AccountId& caller);

    void setFeePercent(const AccountId& caller, std::uint32_t percent);
    void setMinStake(const AccountId& caller, const Amount& minStake);
    void transferAuthority(const AccountId& caller, const AccountId& newAuthority);
    void withdraw(const AccountId& caller, const AccountId& receiver, const Amount& amount);

    // Called after each committed operation, outside the engine lock.
    void setEventListener(EventListener listener);

    RoundSummary getCurrentRound() const;
    RoundSummary getRound(RoundId roundId) const;
    BidDetail getBid(RoundId roundId, BidId bidId) const;
    std::uint64_t getRoundCount() const;
    Amount getBalance() const;
    // Retained balance minus the stakes still committed to the active round.
    Amount getWithdrawableBalance() const;
    bool hasActiveRound() const;
    std::optional<RoundId> activeRoundId() const;

    std::uint32_t getFeePercent() const;
    Amount getMinStake() const;
    AccountId getAuthority() const;

    std::vector<Event> getEvents() const;
    std::string getEventLogRoot() const;
    std::vector<std::string> getEventProof(std::size_t index) const;

private:
    struct Transaction {
        std::map<RoundId, Round> rounds;
        std::optional<RoundId> activeRoundId;
        RoundId lastRoundId = 0;
        Amount balance;
        std::vector<Payment> payments;
        std::vector<Event> events;
    };

    Transaction begin() const;
    Round& stage(Transaction& tx, RoundId roundId) const;
    void openRound(Transaction& tx) const;
    void applyRoll(Transaction& tx, const DiceRoll& roll) const;
    std::vector<Event> commit(Transaction tx);
    std::vector<Event> publish(std::vector<Event> events);
    void settle(const std::vector<Payment>& batch);
    static void notify(const EventListener& listener, const std::vector<Event>& events);

    Amount withdrawableBalance() const;
    const Round& findRound(RoundId roundId) const;
    static RoundSummary summarize(const Round& round);

    mutable std::shared_mutex mutex_;
    EngineConfig config_;
    AuthorityGuardPtr authority_;
    PaymentGatewayPtr payments_;
    DiceOraclePtr oracle_;

    std::map<RoundId, Round> rounds_;
    // Set when a round is created, cleared when it finishes.
    std::optional<RoundId> activeRoundId_;
    RoundId lastRoundId_ = 0;
    Amount balance_;

    EventLog eventLog_;
    EventListener listener_;
};

} // namespace dp
