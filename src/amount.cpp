#include "amount.hpp"

#include <cctype>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace dp {

namespace {

// Largest uint256 has 78 decimal digits.
constexpr std::size_t kMaxAmountDigits = 78;

} // namespace

Amount parseAmount(const std::string& text) {
    if (text.empty()) {
        throw std::runtime_error("Amount must not be empty");
    }
    if (text.size() > kMaxAmountDigits) {
        throw std::runtime_error("Amount exceeds 256-bit range: " + text);
    }
    for (unsigned char c : text) {
        if (!std::isdigit(c)) {
            throw std::runtime_error("Amount must be a non-negative integer: " + text);
        }
    }
    try {
        return Amount(text.c_str());
    } catch (const std::exception& ex) {
        throw std::runtime_error("Amount exceeds 256-bit range: " + text + " (" + ex.what() + ")");
    }
}

std::string formatAmount(const Amount& value) {
    return value.str();
}

std::string amountToWire(const Amount& value) {
    std::vector<unsigned char> bytes;
    bytes.reserve(kAmountWireBytes);
    mp::export_bits(value, std::back_inserter(bytes), 8);

    std::string out(kAmountWireBytes - bytes.size(), '\0');
    for (unsigned char byte : bytes) {
        out.push_back(static_cast<char>(byte));
    }
    return out;
}

Amount percentOf(const Amount& value, std::uint32_t percent) {
    // Split on 100 so the product never exceeds the 256-bit range.
    return value / 100 * percent + value % 100 * percent / 100;
}

} // namespace dp
