#include "event_log.hpp"

#include "picosha2.h"

#include <stdexcept>
#include <vector>

namespace dp {

namespace {

std::string hashBytes(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string hashPair(const std::string& left, const std::string& right) {
    return hashBytes(left + right);
}

// Odd trailing nodes are paired with themselves.
std::vector<std::string> nextLayer(const std::vector<std::string>& layer) {
    std::vector<std::string> next;
    next.reserve((layer.size() + 1) / 2);
    for (std::size_t i = 0; i < layer.size(); i += 2) {
        const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
        next.push_back(hashPair(layer[i], right));
    }
    return next;
}

} // namespace

void EventLog::append(const Event& event) {
    leaves_.push_back(hashEvent(event));
    events_.push_back(event);
}

std::string EventLog::leafHash(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string EventLog::hashEvent(const Event& event) {
    return hashBytes(encodeEvent(event));
}

std::string EventLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }
    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        layer = nextLayer(layer);
    }
    return layer.front();
}

std::vector<std::string> EventLog::merkleProof(std::size_t leafIndex) const {
    if (leafIndex >= leaves_.size()) {
        throw std::out_of_range("Event index " + std::to_string(leafIndex) + " is not in the log");
    }

    std::vector<std::string> proof;
    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t sibling = index ^ 1U;
        if (sibling >= layer.size()) {
            sibling = index;
        }
        proof.push_back(layer[sibling]);
        layer = nextLayer(layer);
        index /= 2;
    }
    return proof;
}

bool EventLog::verifyProof(const std::string& leafHash,
                           std::size_t leafIndex,
                           const std::vector<std::string>& proof,
                           const std::string& root) {
    std::string current = leafHash;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
    }
    return index == 0 && current == root;
}

} // namespace dp
