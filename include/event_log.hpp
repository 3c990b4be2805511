#pragma once

#include "events.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace dp {

// Append-only audit log. Each event's wire encoding is hashed into a Merkle
// transcript so observers can check inclusion against a published root.
class EventLog {
public:
    void append(const Event& event);

    const std::vector<Event>& events() const { return events_; }
    const Event& at(std::size_t index) const { return events_.at(index); }
    std::size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

    std::string leafHash(std::size_t index) const;
    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static std::string hashEvent(const Event& event);
    static bool verifyProof(const std::string& leafHash,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

private:
    std::vector<Event> events_;
    std::vector<std::string> leaves_;
};

} // namespace dp
