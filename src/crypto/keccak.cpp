#include "crypto/keccak.hpp"
#include <cryptopp/keccak.h>

namespace Crypto {
  static std::string BytesToHex0x(const std::uint8_t* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out; out.reserve(len * 2 + 2); out += "0x";
    for (size_t i = 0; i < len; ++i) { std::uint8_t b = data[i]; out += hex[b >> 4]; out += hex[b & 0xF]; }
    return out;
  }

  Digest256 Keccak256(const std::string& raw) {
    CryptoPP::Keccak_256 hash;
    Digest256 digest{};
    hash.CalculateDigest(digest.data(), reinterpret_cast<const CryptoPP::byte*>(raw.data()), raw.size());
    return digest;
  }

  std::string Keccak256Raw(const std::string& raw) {
    auto digest = Keccak256(raw);
    return BytesToHex0x(digest.data(), digest.size());
  }
}
