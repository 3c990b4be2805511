#include "round_manager.hpp"

#include "errors.hpp"
#include "settlement.hpp"

#include <mutex>
#include <utility>

namespace dp {

namespace {

std::string roundLabel(RoundId roundId) {
    return "round " + std::to_string(roundId);
}

void requireState(const Round& round, RoundState expected, const char* operation) {
    if (round.state != expected) {
        throw InvalidRoundStateError(std::string("Cannot ") + operation + ": " + roundLabel(round.id) +
                                     " is " + toString(round.state) + ", expected " +
                                     toString(expected));
    }
}

void debit(Amount& balance, const Amount& amount, const char* purpose) {
    if (balance < amount) {
        throw InsufficientBalanceError(std::string("Retained balance ") + formatAmount(balance) +
                                       " cannot cover " + purpose + " of " + formatAmount(amount));
    }
    balance -= amount;
}

} // namespace

RoundManager::RoundManager(EngineConfig config,
                           AuthorityGuardPtr authority,
                           PaymentGatewayPtr payments,
                           DiceOraclePtr oracle)
    : config_(std::move(config)),
      authority_(std::move(authority)),
      payments_(std::move(payments)),
      oracle_(std::move(oracle)) {
    if (!authority_) {
        throw InvalidConfigurationError("Round manager requires an authority guard");
    }
    if (!payments_) {
        throw InvalidConfigurationError("Round manager requires a payment gateway");
    }
    config_.authority = authority_->current();
    validateConfig(config_);
}

RoundManager::RoundManager(EngineConfig config, PaymentGatewayPtr payments, DiceOraclePtr oracle)
    : RoundManager(config,
                   std::make_shared<IdentityAuthority>(config.authority),
                   std::move(payments),
                   std::move(oracle)) {}

RoundId RoundManager::createRound(const AccountId& caller) {
    std::vector<Event> published;
    EventListener listener;
    RoundId roundId = 0;
    {
        std::unique_lock lock(mutex_);
        authority_->require(caller, "create a round");
        Transaction tx = begin();
        openRound(tx);
        roundId = tx.lastRoundId;
        published = commit(std::move(tx));
        listener = listener_;
    }
    notify(listener, published);
    return roundId;
}

BidReceipt RoundManager::placeBid(const AccountId& caller,
                                  RoundId roundId,
                                  Side side,
                                  const Amount& amount) {
    BidReceipt receipt;
    std::vector<Event> published;
    EventListener listener;
    {
        std::unique_lock lock(mutex_);
        auto it = rounds_.find(roundId);
        if (it == rounds_.end()) {
            throw RoundNotFoundError("Unknown " + roundLabel(roundId));
        }
        Round& round = it->second;
        requireState(round, RoundState::WaitingForBids, "place a bid");
        if (amount <= config_.minStake) {
            throw BelowMinimumStakeError("Bid of " + formatAmount(amount) +
                                         " must exceed the minimum stake of " +
                                         formatAmount(config_.minStake));
        }
        if (caller.empty()) {
            throw UnauthorizedError("Bettor identity must not be empty");
        }

        // Everything that can throw happens before the round is touched.
        const Amount fee = percentOf(amount, config_.feePercent);
        const Amount netStake = amount - fee;
        const Amount newPool = round.poolFor(side) + netStake;
        const Amount newBalance = balance_ + amount;

        Bid bid;
        bid.id = round.nextBidId;
        bid.bettor = caller;
        bid.side = side;
        bid.stake = netStake;
        round.bids.emplace(bid.id, bid);
        round.poolFor(side) = newPool;
        ++round.nextBidId;
        balance_ = newBalance;

        receipt = BidReceipt{ true, round.id, bid.id, caller, netStake, fee };
        published = publish({ BidPlaced{ bid.id, round.id, caller, netStake, fee, side } });
        listener = listener_;
    }
    notify(listener, published);
    return receipt;
}

void RoundManager::equalizeBids(const AccountId& caller, RoundId roundId) {
    std::vector<Event> published;
    EventListener listener;
    {
        std::unique_lock lock(mutex_);
        authority_->require(caller, "equalize bids");
        Transaction tx = begin();
        Round& round = stage(tx, roundId);
        requireState(round, RoundState::WaitingForBids, "equalize bids");
        round.state = RoundState::Equalizing;

        if (round.bigPoolTotal != 0 || round.smallPoolTotal != 0) {
            EqualizationPlan plan = equalize(round.bigPoolTotal, round.smallPoolTotal, round.bids);
            for (const auto& [bidId, stake] : plan.adjustedStakes) {
                round.bids.at(bidId).stake = stake;
            }
            // A refund the balance cannot cover fails the whole operation; it is never dropped.
            for (const auto& refund : plan.refunds) {
                debit(tx.balance, refund.amount, "equalization refund");
                tx.payments.push_back(
                    Payment{ refund.bettor, refund.amount, PaymentKind::Refund, round.id, refund.bidId });
                tx.events.push_back(EqualizeRefund{ round.id, refund.bidId, refund.bettor, refund.amount });
            }
            round.bigPoolTotal = plan.bigPoolTotal;
            round.smallPoolTotal = plan.smallPoolTotal;
            round.state = RoundState::Equalized;
            tx.events.push_back(
                RoundEqualized{ round.id, round.state, round.bigPoolTotal, round.smallPoolTotal });
        } else {
            // No-op round: straight to Equalized, nothing to announce.
            round.state = RoundState::Equalized;
        }
        published = commit(std::move(tx));
        listener = listener_;
    }
    notify(listener, published);
}

void RoundManager::processRound(const AccountId& caller, int dice1, int dice2, int dice3) {
    DiceRoll roll;
    roll.values = { dice1, dice2, dice3 };

    std::vector<Event> published;
    EventListener listener;
    {
        std::unique_lock lock(mutex_);
        authority_->require(caller, "process a round");
        Transaction tx = begin();
        applyRoll(tx, roll);
        published = commit(std::move(tx));
        listener = listener_;
    }
    notify(listener, published);
}

void RoundManager::processRoundFromOracle(const AccountId& caller) {
    std::vector<Event> published;
    EventListener listener;
    {
        std::unique_lock lock(mutex_);
        authority_->require(caller, "process a round");
        if (!oracle_) {
            throw InvalidConfigurationError("No dice oracle configured");
        }
        if (!activeRoundId_) {
            throw RoundNotFoundError("No active round to process");
        }
        // Guard before drawing so a rejected call does not consume a roll.
        requireState(findRound(*activeRoundId_), RoundState::Equalized, "process the roll");
        DiceRoll roll = oracle_->roll(*activeRoundId_);
        Transaction tx = begin();
        applyRoll(tx, roll);
        published = commit(std::move(tx));
        listener = listener_;
    }
    notify(listener, published);
}

void RoundManager::setFeePercent(const AccountId& caller, std::uint32_t percent) {
    std::vector<Event> published;
    EventListener listener;
    {
        std::unique_lock lock(mutex_);
        authority_->require(caller, "set the fee percent");
        if (percent > kMaxFeePercent) {
            throw InvalidConfigurationError("Fee percent must be at most 100, got " +
                                            std::to_string(percent));
        }
        FeePercentChanged event{ config_.feePercent, percent };
        config_.feePercent = percent;
        published = publish({ event });
        listener = listener_;
    }
    notify(listener, published);
}

void RoundManager::setMinStake(const AccountId& caller, const Amount& minStake) {
    std::vector<Event> published;
    EventListener listener;
    {
        std::unique_lock lock(mutex_);
        authority_->require(caller, "set the minimum stake");
        MinStakeChanged event{ config_.minStake, minStake };
        config_.minStake = minStake;
        published = publish({ event });
        listener = listener_;
    }
    notify(listener, published);
}

void RoundManager::transferAuthority(const AccountId& caller, const AccountId& newAuthority) {
    std::vector<Event> published;
    EventListener listener;
    {
        std::unique_lock lock(mutex_);
        authority_->require(caller, "transfer authority");
        if (newAuthority.empty()) {
            throw InvalidConfigurationError("Authority identity must not be empty");
        }
        AuthorityTransferred event{ authority_->current(), newAuthority };
        authority_->reassign(newAuthority);
        config_.authority = newAuthority;
        published = publish({ event });
        listener = listener_;
    }
    notify(listener, published);
}

void RoundManager::withdraw(const AccountId& caller, const AccountId& receiver, const Amount& amount) {
    std::vector<Event> published;
    EventListener listener;
    {
        std::unique_lock lock(mutex_);
        authority_->require(caller, "withdraw");
        const Amount available = withdrawableBalance();
        if (amount >= available) {
            throw InsufficientBalanceError("Withdrawal of " + formatAmount(amount) +
                                           " must be below the withdrawable balance of " +
                                           formatAmount(available) + " (retained " +
                                           formatAmount(balance_) + ")");
        }
        if (amount > 0) {
            settle({ Payment{ receiver, amount, PaymentKind::Withdrawal, 0, 0 } });
        }
        balance_ -= amount;
        published = publish({ Withdrawal{ receiver, amount } });
        listener = listener_;
    }
    notify(listener, published);
}

void RoundManager::setEventListener(EventListener listener) {
    std::unique_lock lock(mutex_);
    listener_ = std::move(listener);
}

RoundSummary RoundManager::getCurrentRound() const {
    std::shared_lock lock(mutex_);
    if (lastRoundId_ == 0) {
        throw RoundNotFoundError("No round has been created yet");
    }
    return summarize(findRound(lastRoundId_));
}

RoundSummary RoundManager::getRound(RoundId roundId) const {
    std::shared_lock lock(mutex_);
    return summarize(findRound(roundId));
}

BidDetail RoundManager::getBid(RoundId roundId, BidId bidId) const {
    std::shared_lock lock(mutex_);
    const Round& round = findRound(roundId);
    auto it = round.bids.find(bidId);
    if (it == round.bids.end()) {
        throw BidNotFoundError("Unknown bid " + std::to_string(bidId) + " in " + roundLabel(roundId));
    }
    const Bid& bid = it->second;
    return BidDetail{ round.id, bid.id, bid.bettor, bid.side, bid.stake, bid.won, round.isFinished() };
}

std::uint64_t RoundManager::getRoundCount() const {
    std::shared_lock lock(mutex_);
    return lastRoundId_;
}

Amount RoundManager::getBalance() const {
    std::shared_lock lock(mutex_);
    return balance_;
}

Amount RoundManager::getWithdrawableBalance() const {
    std::shared_lock lock(mutex_);
    return withdrawableBalance();
}

bool RoundManager::hasActiveRound() const {
    std::shared_lock lock(mutex_);
    return activeRoundId_.has_value();
}

std::optional<RoundId> RoundManager::activeRoundId() const {
    std::shared_lock lock(mutex_);
    return activeRoundId_;
}

std::uint32_t RoundManager::getFeePercent() const {
    std::shared_lock lock(mutex_);
    return config_.feePercent;
}

Amount RoundManager::getMinStake() const {
    std::shared_lock lock(mutex_);
    return config_.minStake;
}

AccountId RoundManager::getAuthority() const {
    std::shared_lock lock(mutex_);
    return authority_->current();
}

std::vector<Event> RoundManager::getEvents() const {
    std::shared_lock lock(mutex_);
    return eventLog_.events();
}

std::string RoundManager::getEventLogRoot() const {
    std::shared_lock lock(mutex_);
    return eventLog_.merkleRoot();
}

std::vector<std::string> RoundManager::getEventProof(std::size_t index) const {
    std::shared_lock lock(mutex_);
    return eventLog_.merkleProof(index);
}

RoundManager::Transaction RoundManager::begin() const {
    Transaction tx;
    tx.activeRoundId = activeRoundId_;
    tx.lastRoundId = lastRoundId_;
    tx.balance = balance_;
    return tx;
}

Round& RoundManager::stage(Transaction& tx, RoundId roundId) const {
    auto staged = tx.rounds.find(roundId);
    if (staged != tx.rounds.end()) {
        return staged->second;
    }
    return tx.rounds.emplace(roundId, findRound(roundId)).first->second;
}

void RoundManager::openRound(Transaction& tx) const {
    if (tx.activeRoundId) {
        throw RoundAlreadyActiveError(roundLabel(*tx.activeRoundId) + " is still active");
    }
    Round round;
    round.id = tx.lastRoundId + 1;
    tx.rounds.emplace(round.id, round);
    tx.lastRoundId = round.id;
    tx.activeRoundId = round.id;
    tx.events.push_back(RoundCreated{ round.id });
}

void RoundManager::applyRoll(Transaction& tx, const DiceRoll& roll) const {
    for (int value : roll.values) {
        if (!isValidDie(value)) {
            throw InvalidDiceValueError("Die value " + std::to_string(value) + " is outside [" +
                                        std::to_string(kMinDieValue) + "," +
                                        std::to_string(kMaxDieValue) + "]");
        }
    }
    if (!tx.activeRoundId) {
        throw RoundNotFoundError("No active round to process");
    }
    Round& round = stage(tx, *tx.activeRoundId);
    requireState(round, RoundState::Equalized, "process the roll");

    round.state = RoundState::Processing;
    round.dice = roll;
    round.totalPips = roll.totalPips();
    round.result = classifyPips(round.totalPips);

    // With an empty side there is no opposing stake to pay out of.
    if (round.bigPoolTotal != 0 && round.smallPoolTotal != 0) {
        round.state = RoundState::PayingWinners;
        for (const auto& payout : computePayouts(round.result, round.bids)) {
            if (!payout.won) {
                continue;
            }
            round.bids.at(payout.bidId).won = true;
            if (payout.amount == 0) {
                continue;
            }
            debit(tx.balance, payout.amount, "winner payout");
            tx.payments.push_back(
                Payment{ payout.bettor, payout.amount, PaymentKind::Payout, round.id, payout.bidId });
            tx.events.push_back(WinnerPaid{ round.id, payout.bidId, payout.bettor, payout.amount });
        }
    }

    round.state = RoundState::Finished;
    tx.events.push_back(
        RoundProcessed{ round.id, round.state, round.result, round.dice, round.totalPips });
    tx.activeRoundId.reset();
    openRound(tx);
}

std::vector<Event> RoundManager::commit(Transaction tx) {
    settle(tx.payments);
    for (auto& [roundId, round] : tx.rounds) {
        rounds_[roundId] = std::move(round);
    }
    activeRoundId_ = tx.activeRoundId;
    lastRoundId_ = tx.lastRoundId;
    balance_ = tx.balance;
    return publish(std::move(tx.events));
}

std::vector<Event> RoundManager::publish(std::vector<Event> events) {
    for (const auto& event : events) {
        eventLog_.append(event);
    }
    return events;
}

void RoundManager::settle(const std::vector<Payment>& batch) {
    if (batch.empty()) {
        return;
    }
    try {
        payments_->executeBatch(batch);
    } catch (const std::exception& ex) {
        throw PaymentFailedError(std::string("Payment batch of ") + std::to_string(batch.size()) +
                                 " transfer(s) failed: " + ex.what());
    }
}

void RoundManager::notify(const EventListener& listener, const std::vector<Event>& events) {
    if (!listener) {
        return;
    }
    for (const auto& event : events) {
        listener(event);
    }
}

Amount RoundManager::withdrawableBalance() const {
    if (!activeRoundId_) {
        return balance_;
    }
    const Round& active = findRound(*activeRoundId_);
    const Amount committed = active.bigPoolTotal + active.smallPoolTotal;
    return balance_ > committed ? balance_ - committed : Amount(0);
}

const Round& RoundManager::findRound(RoundId roundId) const {
    auto it = rounds_.find(roundId);
    if (it == rounds_.end()) {
        throw RoundNotFoundError("Unknown " + roundLabel(roundId));
    }
    return it->second;
}

RoundSummary RoundManager::summarize(const Round& round) {
    RoundSummary summary;
    summary.id = round.id;
    summary.state = round.state;
    summary.result = round.result;
    summary.dice = round.dice;
    summary.totalPips = round.totalPips;
    summary.bigPoolTotal = round.bigPoolTotal;
    summary.smallPoolTotal = round.smallPoolTotal;
    summary.bidIds.reserve(round.bids.size());
    for (const auto& [bidId, bid] : round.bids) {
        (void)bid;
        summary.bidIds.push_back(bidId);
    }
    return summary;
}

} // namespace dp
