#pragma once
#include "common/address.hpp"
#include "common/uint256.hpp"

// Deposit bookkeeping and governance owned by the host vault.
class VaultView {
public:
  virtual ~VaultView() = default;
  virtual U256 TotalDeposited() const = 0;
  virtual U256 MaxCapacity() const = 0;
  // Cumulative deposit of one user
  virtual U256 UserDeposit(const Address& user) const = 0;
  virtual Address FeeRecipient() const = 0;
  virtual bool IsAuthorized(const Address& caller) const = 0;
};

// Share token backing the vault.
class TokenLedger {
public:
  virtual ~TokenLedger() = default;
  virtual U256 TotalSupply() const = 0;
  virtual U256 TotalShares() const = 0;
  virtual U256 BalanceOf(const Address& user) const = 0;
  // Returns false and changes nothing when the transfer cannot be made
  virtual bool TransferValue(const Address& from, const Address& to, const U256& amount) = 0;
};
