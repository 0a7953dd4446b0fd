#include "common/address.hpp"
#include "crypto/keccak.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

static const std::string kZeroHex = "0x0000000000000000000000000000000000000000";

static std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

Address::Address() : hex_(kZeroHex) {}

std::optional<Address> Address::TryParse(const std::string& text) {
  std::string body = Strip0x(text);
  if (body.size() != 40) return std::nullopt;
  if (!std::all_of(body.begin(), body.end(), [](unsigned char c){ return std::isxdigit(c) != 0; })) return std::nullopt;
  std::transform(body.begin(), body.end(), body.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return Address("0x" + body);
}

Address Address::Parse(const std::string& text) {
  auto a = TryParse(text);
  if (!a) throw std::invalid_argument("not a 20-byte hex address: " + text);
  return *a;
}

bool Address::IsZero() const { return hex_ == kZeroHex; }

std::string Address::ToChecksum() const {
  std::string body = hex_.substr(2);
  auto digest = Crypto::Keccak256(body);
  std::string out = "0x";
  for (size_t i = 0; i < body.size(); ++i) {
    char c = body[i];
    std::uint8_t nibble = (i % 2 == 0) ? (digest[i / 2] >> 4) : (digest[i / 2] & 0x0F);
    if (std::isalpha(static_cast<unsigned char>(c)) && nibble >= 8) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    out += c;
  }
  return out;
}
