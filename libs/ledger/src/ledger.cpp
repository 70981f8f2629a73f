#include "swapvault/ledger/ledger.hpp"

#include "swapvault/common/checked_math.hpp"

namespace swapvault {
namespace ledger {

namespace {

CreditResult credit_rejected(common::Status status, common::Amount new_total, common::Amount cap) {
  return CreditResult{
      .status = status,
      .reject_code = common::reject_code(status),
      .new_total = new_total,
      .cap = cap,
  };
}

}  // namespace

Ledger::Ledger(common::Amount bank_cap, UnitConverter converter)
    : converter_(converter) {
  totals_.bank_cap = bank_cap;
}

CreditResult Ledger::credit(common::AccountId user, common::Amount amount_native) {
  using common::Status;
  std::scoped_lock lock(mutex_);

  const auto amount_cap = converter_.to_cap_units(amount_native);
  if (!amount_cap) {
    return credit_rejected(Status::kArithmeticOverflow, 0, totals_.bank_cap);
  }
  const auto new_total = common::checked_add(totals_.total_deposited, *amount_cap);
  if (!new_total) {
    return credit_rejected(Status::kArithmeticOverflow, 0, totals_.bank_cap);
  }
  if (*new_total > totals_.bank_cap) {
    return credit_rejected(Status::kCapExceeded, *new_total, totals_.bank_cap);
  }

  auto it = balances_.find(user);
  const common::Amount current = it == balances_.end() ? 0 : it->second;
  const auto new_balance = common::checked_add(current, amount_native);
  const auto new_held = common::checked_add(totals_.total_held, amount_native);
  if (!new_balance || !new_held) {
    return credit_rejected(Status::kArithmeticOverflow, *new_total, totals_.bank_cap);
  }

  // Commit point; nothing below can fail.
  if (it == balances_.end()) {
    balances_.emplace(user, *new_balance);
  } else {
    it->second = *new_balance;
  }
  totals_.total_held = *new_held;
  totals_.total_deposited = *new_total;
  ++totals_.operation_count;

  return CreditResult{
      .status = Status::kOk,
      .reject_code = 0,
      .new_total = *new_total,
      .cap = totals_.bank_cap,
  };
}

common::Status Ledger::debit(common::AccountId user, common::Amount amount_native) {
  std::scoped_lock lock(mutex_);
  if (amount_native == 0) {
    return common::Status::kZeroAmount;
  }
  auto it = balances_.find(user);
  if (it == balances_.end() || it->second < amount_native) {
    return common::Status::kInsufficientBalance;
  }
  it->second -= amount_native;
  totals_.total_held -= amount_native;
  ++totals_.operation_count;
  return common::Status::kOk;
}

common::Status Ledger::restore(common::AccountId user, common::Amount amount_native) {
  std::scoped_lock lock(mutex_);
  const common::Amount current = balance_of_locked(user);
  const auto new_balance = common::checked_add(current, amount_native);
  const auto new_held = common::checked_add(totals_.total_held, amount_native);
  if (!new_balance || !new_held) {
    return common::Status::kArithmeticOverflow;
  }
  balances_[user] = *new_balance;
  totals_.total_held = *new_held;
  return common::Status::kOk;
}

common::Amount Ledger::set_bank_cap(common::Amount cap) {
  std::scoped_lock lock(mutex_);
  const common::Amount previous = totals_.bank_cap;
  totals_.bank_cap = cap;
  return previous;
}

common::Amount Ledger::balance_of(common::AccountId user) const {
  std::scoped_lock lock(mutex_);
  return balance_of_locked(user);
}

LedgerTotals Ledger::totals() const {
  std::scoped_lock lock(mutex_);
  return totals_;
}

std::vector<std::pair<common::AccountId, common::Amount>> Ledger::balances() const {
  std::scoped_lock lock(mutex_);
  return {balances_.begin(), balances_.end()};
}

bool Ledger::is_solvent() const {
  std::scoped_lock lock(mutex_);
  common::Wide sum = 0;
  for (const auto& [user, balance] : balances_) {
    if (balance > totals_.total_held) {
      return false;
    }
    sum += balance;
  }
  return sum == totals_.total_held;
}

common::Amount Ledger::balance_of_locked(common::AccountId user) const {
  if (auto it = balances_.find(user); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

}  // namespace ledger
}  // namespace swapvault
