#include "common/uint256.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

static const std::string kEtherSuffix = "ether";

U256 ParseU256(const std::string& text) {
  std::string digits = text;
  bool ether = false;
  if (digits.size() > kEtherSuffix.size() &&
      digits.compare(digits.size() - kEtherSuffix.size(), kEtherSuffix.size(), kEtherSuffix) == 0) {
    digits.resize(digits.size() - kEtherSuffix.size());
    ether = true;
  }
  if (digits.empty() || digits.size() > 78 ||
      !std::all_of(digits.begin(), digits.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
    throw std::invalid_argument("not an unsigned decimal amount: " + text);
  }
  U256 value(digits.c_str());
  if (ether) value *= Ether(1);
  return value;
}

std::string ToDecimal(const U256& value) { return value.str(); }

U256 Ether(std::uint64_t whole) {
  static const U256 kWei("1000000000000000000");
  return U256(whole) * kWei;
}
