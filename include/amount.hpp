#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace dp {

namespace mp = boost::multiprecision;

// Base currency units. Arithmetic throws on overflow and on subtraction below zero.
using Amount = mp::checked_uint256_t;

constexpr std::size_t kAmountWireBytes = 32;

Amount parseAmount(const std::string& text);
std::string formatAmount(const Amount& value);

// Fixed-width big-endian encoding used by the event wire format.
std::string amountToWire(const Amount& value);

// Truncating percentage: value * percent / 100, exact across the whole range.
Amount percentOf(const Amount& value, std::uint32_t percent);

} // namespace dp
