#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

// 20-byte account identity. Stored as lowercase 0x-hex; the default value is the null identity.
class Address {
public:
  Address();
  // Accepts 40 hex digits with or without 0x, any case. Throws std::invalid_argument.
  static Address Parse(const std::string& text);
  static std::optional<Address> TryParse(const std::string& text);

  bool IsZero() const;
  const std::string& Hex() const { return hex_; }
  // EIP-55 mixed-case rendering
  std::string ToChecksum() const;

  bool operator==(const Address& other) const { return hex_ == other.hex_; }
  bool operator!=(const Address& other) const { return hex_ != other.hex_; }
  bool operator<(const Address& other) const { return hex_ < other.hex_; }
private:
  explicit Address(std::string lower_hex) : hex_(std::move(lower_hex)) {}
  std::string hex_;
};

namespace std {
  template <> struct hash<Address> {
    size_t operator()(const Address& a) const noexcept { return std::hash<std::string>()(a.Hex()); }
  };
}
