#include "vault/memory_ledger.hpp"
#include <stdexcept>

U256 InMemoryVault::UserDeposit(const Address& user) const {
  auto it = deposits_.find(user);
  return it == deposits_.end() ? U256(0) : it->second;
}

void InMemoryVault::Deposit(const Address& user, const U256& amount) {
  U256 next_total = total_deposited_ + amount;
  if (capacity_ != 0 && next_total > capacity_) {
    throw std::runtime_error("deposit exceeds vault capacity");
  }
  total_deposited_ = next_total;
  deposits_[user] += amount;
}

U256 InMemoryTokenLedger::BalanceOf(const Address& user) const {
  auto it = balances_.find(user);
  return it == balances_.end() ? U256(0) : it->second;
}

bool InMemoryTokenLedger::TransferValue(const Address& from, const Address& to, const U256& amount) {
  if (frozen_ || to.IsZero()) return false;
  U256 from_balance = BalanceOf(from);
  if (from_balance < amount) return false;
  balances_[from] = from_balance - amount;
  balances_[to] += amount;
  return true;
}
