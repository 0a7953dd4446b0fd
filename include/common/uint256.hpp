#pragma once
#include <cstdint>
#include <string>
#include <boost/multiprecision/cpp_int.hpp>

// Checked 256-bit unsigned: overflow throws std::overflow_error, underflow std::range_error.
using U256 = boost::multiprecision::checked_uint256_t;

// Parses a decimal amount. Accepts an optional "ether" suffix (x 10^18). Throws std::invalid_argument.
U256 ParseU256(const std::string& text);
std::string ToDecimal(const U256& value);
U256 Ether(std::uint64_t whole);

// Fixed-point helpers with a scale of 10000 (1 bps = 1/10000).
// Every division truncates toward zero.
namespace BasisPoints {
  inline constexpr std::uint32_t kScale = 10000;
  inline constexpr std::uint32_t kPerPercent = 100;

  // num * 10000 / den
  inline U256 Ratio(const U256& num, const U256& den) { return num * kScale / den; }
  // amount * bps / 10000
  inline U256 Apply(const U256& amount, const U256& bps) { return amount * bps / kScale; }
  // 799 bps -> 7
  inline U256 WholePercent(const U256& bps) { return bps / kPerPercent; }
}
