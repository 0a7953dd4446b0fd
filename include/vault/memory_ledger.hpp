#pragma once
#include <unordered_map>
#include <unordered_set>
#include "vault/collaborators.hpp"

// Reference collaborators kept entirely in memory, for the CLI driver and tests.
class InMemoryVault : public VaultView {
public:
  U256 TotalDeposited() const override { return total_deposited_; }
  U256 MaxCapacity() const override { return capacity_; }
  U256 UserDeposit(const Address& user) const override;
  Address FeeRecipient() const override { return fee_recipient_; }
  bool IsAuthorized(const Address& caller) const override { return authorized_.count(caller) != 0; }

  void SetCapacity(const U256& capacity) { capacity_ = capacity; }
  // Throws std::runtime_error when a bounded vault would overflow its capacity
  void Deposit(const Address& user, const U256& amount);
  void SetFeeRecipient(const Address& recipient) { fee_recipient_ = recipient; }
  void Authorize(const Address& caller) { authorized_.insert(caller); }
  void Revoke(const Address& caller) { authorized_.erase(caller); }
private:
  U256 capacity_;
  U256 total_deposited_;
  std::unordered_map<Address, U256> deposits_;
  std::unordered_set<Address> authorized_;
  Address fee_recipient_;
};

class InMemoryTokenLedger : public TokenLedger {
public:
  U256 TotalSupply() const override { return supply_; }
  U256 TotalShares() const override { return shares_; }
  U256 BalanceOf(const Address& user) const override;
  bool TransferValue(const Address& from, const Address& to, const U256& amount) override;

  void SetSupply(const U256& supply, const U256& shares) { supply_ = supply; shares_ = shares; }
  void SetBalance(const Address& user, const U256& amount) { balances_[user] = amount; }
  // Makes every following TransferValue fail, to exercise rollback paths
  void SetTransfersFrozen(bool frozen) { frozen_ = frozen; }
private:
  U256 supply_;
  U256 shares_;
  std::unordered_map<Address, U256> balances_;
  bool frozen_ = false;
};
