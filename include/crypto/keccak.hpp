#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace Crypto {
  using Digest256 = std::array<std::uint8_t, 32>;
  // Keccak-256 (pre-NIST padding, as used by EVM) of raw bytes
  Digest256 Keccak256(const std::string& raw);
  // Same digest, 0x-prefixed lowercase hex
  std::string Keccak256Raw(const std::string& raw);
}
