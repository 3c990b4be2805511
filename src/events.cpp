#include "events.hpp"

#include <sstream>

namespace dp {

namespace {

class WireWriter {
public:
    void u8(std::uint8_t v) { out_.push_back(static_cast<char>(v)); }
    void u64(std::uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            out_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
        }
    }
    void amount(const Amount& v) { out_.append(amountToWire(v)); }
    void text(const std::string& s) {
        u64(static_cast<std::uint64_t>(s.size()));
        out_.append(s);
    }
    void dice(const DiceRoll& roll) {
        for (int value : roll.values) {
            u8(static_cast<std::uint8_t>(value));
        }
    }

    std::string take() { return std::move(out_); }

private:
    std::string out_;
};

struct Encoder {
    WireWriter& w;

    void operator()(const RoundCreated& e) const { w.u64(e.roundId); }
    void operator()(const BidPlaced& e) const {
        w.u64(e.bidId);
        w.u64(e.roundId);
        w.text(e.bettor);
        w.amount(e.netStake);
        w.amount(e.fee);
        w.u8(static_cast<std::uint8_t>(e.side));
    }
    void operator()(const EqualizeRefund& e) const {
        w.u64(e.roundId);
        w.u64(e.bidId);
        w.text(e.bettor);
        w.amount(e.amount);
    }
    void operator()(const RoundEqualized& e) const {
        w.u64(e.roundId);
        w.u8(static_cast<std::uint8_t>(e.state));
        w.amount(e.bigPoolTotal);
        w.amount(e.smallPoolTotal);
    }
    void operator()(const WinnerPaid& e) const {
        w.u64(e.roundId);
        w.u64(e.bidId);
        w.text(e.bettor);
        w.amount(e.amount);
    }
    void operator()(const RoundProcessed& e) const {
        w.u64(e.roundId);
        w.u8(static_cast<std::uint8_t>(e.state));
        w.u8(static_cast<std::uint8_t>(e.result));
        w.dice(e.dice);
        w.u64(static_cast<std::uint64_t>(e.totalPips));
    }
    void operator()(const FeePercentChanged& e) const {
        w.u64(e.previous);
        w.u64(e.current);
    }
    void operator()(const MinStakeChanged& e) const {
        w.amount(e.previous);
        w.amount(e.current);
    }
    void operator()(const AuthorityTransferred& e) const {
        w.text(e.previous);
        w.text(e.current);
    }
    void operator()(const Withdrawal& e) const {
        w.text(e.receiver);
        w.amount(e.amount);
    }
};

struct Describer {
    std::ostringstream& oss;

    void operator()(const RoundCreated& e) const { oss << " round=" << e.roundId; }
    void operator()(const BidPlaced& e) const {
        oss << " round=" << e.roundId << " bid=" << e.bidId << " bettor=" << e.bettor
            << " side=" << toString(e.side) << " stake=" << e.netStake << " fee=" << e.fee;
    }
    void operator()(const EqualizeRefund& e) const {
        oss << " round=" << e.roundId << " bid=" << e.bidId << " bettor=" << e.bettor
            << " amount=" << e.amount;
    }
    void operator()(const RoundEqualized& e) const {
        oss << " round=" << e.roundId << " state=" << toString(e.state) << " big=" << e.bigPoolTotal
            << " small=" << e.smallPoolTotal;
    }
    void operator()(const WinnerPaid& e) const {
        oss << " round=" << e.roundId << " bid=" << e.bidId << " bettor=" << e.bettor
            << " amount=" << e.amount;
    }
    void operator()(const RoundProcessed& e) const {
        oss << " round=" << e.roundId << " state=" << toString(e.state)
            << " result=" << toString(e.result) << " dice=" << e.dice.values[0] << ","
            << e.dice.values[1] << "," << e.dice.values[2] << " pips=" << e.totalPips;
    }
    void operator()(const FeePercentChanged& e) const {
        oss << " previous=" << e.previous << " current=" << e.current;
    }
    void operator()(const MinStakeChanged& e) const {
        oss << " previous=" << e.previous << " current=" << e.current;
    }
    void operator()(const AuthorityTransferred& e) const {
        oss << " previous=" << e.previous << " current=" << e.current;
    }
    void operator()(const Withdrawal& e) const {
        oss << " receiver=" << e.receiver << " amount=" << e.amount;
    }
};

} // namespace

const char* eventName(const Event& event) {
    static const char* const kNames[] = {
        "RoundCreated",   "BidPlaced",         "EqualizeRefund",  "RoundEqualized",
        "WinnerPaid",     "RoundProcessed",    "FeePercentChanged", "MinStakeChanged",
        "AuthorityTransferred", "Withdrawal",
    };
    return kNames[event.index()];
}

std::string encodeEvent(const Event& event) {
    WireWriter writer;
    writer.u8(static_cast<std::uint8_t>(event.index()));
    std::visit(Encoder{ writer }, event);
    return writer.take();
}

std::string describeEvent(const Event& event) {
    std::ostringstream oss;
    oss << eventName(event);
    std::visit(Describer{ oss }, event);
    return oss.str();
}

} // namespace dp
