#include "test_ledger.hpp"

#include <cassert>
#include <limits>
#include <map>
#include <random>
#include <stdexcept>

#include "swapvault/ledger/ledger.hpp"
#include "swapvault/ledger/unit_converter.hpp"

namespace swapvault::tests {

namespace {

common::Amount sum_balances(const ledger::Ledger& ledger) {
  common::Amount sum = 0;
  for (const auto& [user, balance] : ledger.balances()) {
    sum += balance;
  }
  return sum;
}

}  // namespace

void test_ledger_credit_debit() {
  ledger::Ledger ledger(std::numeric_limits<common::Amount>::max());

  const auto credited = ledger.credit(7, 100);
  assert(credited.status == common::Status::kOk);
  assert(credited.new_total == 10'000);
  assert(ledger.debit(7, 10) == common::Status::kOk);
  assert(ledger.balance_of(7) == 90);

  auto totals = ledger.totals();
  assert(totals.total_held == 90);
  assert(totals.total_deposited == 10'000);  // withdrawals do not free cap
  assert(totals.operation_count == 2);

  assert(ledger.debit(7, 91) == common::Status::kInsufficientBalance);
  assert(ledger.debit(8, 1) == common::Status::kInsufficientBalance);
  assert(ledger.debit(7, 0) == common::Status::kZeroAmount);

  // Rollback of a debit restores the balance but is not an operation of its own.
  assert(ledger.debit(7, 40) == common::Status::kOk);
  assert(ledger.restore(7, 40) == common::Status::kOk);
  totals = ledger.totals();
  assert(ledger.balance_of(7) == 90);
  assert(totals.total_held == 90);
  assert(totals.operation_count == 3);

  const auto overflow = ledger.credit(7, std::numeric_limits<common::Amount>::max());
  assert(overflow.status == common::Status::kArithmeticOverflow);
  assert(overflow.reject_code == common::reject_code(common::Status::kArithmeticOverflow));
  assert(ledger.balance_of(7) == 90);
}

void test_ledger_solvency_random_walk() {
  ledger::Ledger ledger(std::numeric_limits<common::Amount>::max());
  std::map<common::AccountId, common::Amount> model;
  std::mt19937_64 rng(0x5eed);
  std::uniform_int_distribution<common::AccountId> pick_user(1, 8);
  std::uniform_int_distribution<common::Amount> pick_amount(1, 1'000'000'000);

  for (int step = 0; step < 2'000; ++step) {
    const common::AccountId user = pick_user(rng);
    if (rng() % 3 != 0 || model[user] == 0) {
      const common::Amount amount = pick_amount(rng);
      assert(ledger.credit(user, amount).status == common::Status::kOk);
      model[user] += amount;
    } else {
      const common::Amount amount = 1 + rng() % model[user];
      assert(ledger.debit(user, amount) == common::Status::kOk);
      model[user] -= amount;
    }

    assert(ledger.is_solvent());
    assert(sum_balances(ledger) == ledger.totals().total_held);
    assert(ledger.balance_of(user) == model[user]);
  }
}

void test_ledger_cap_enforcement() {
  ledger::Ledger ledger(1'000);  // 10 reference units

  assert(ledger.credit(1, 10).status == common::Status::kOk);
  const auto before = ledger.totals();

  const auto over = ledger.credit(2, 1);
  assert(over.status == common::Status::kCapExceeded);
  assert(over.reject_code == common::reject_code(common::Status::kCapExceeded));
  assert(over.new_total == 1'100);
  assert(over.cap == 1'000);

  const auto after = ledger.totals();
  assert(after.total_deposited == before.total_deposited);
  assert(after.total_held == before.total_held);
  assert(after.operation_count == before.operation_count);
  assert(ledger.balance_of(2) == 0);
  assert(ledger.balances().size() == 1);

  // The cap bounds lifetime volume, so a withdrawal leaves no headroom.
  assert(ledger.debit(1, 10) == common::Status::kOk);
  assert(ledger.credit(1, 1).status == common::Status::kCapExceeded);

  assert(ledger.set_bank_cap(2'000) == 1'000);
  assert(ledger.totals().bank_cap == 2'000);
  assert(ledger.credit(2, 1).status == common::Status::kOk);
  assert(ledger.totals().total_deposited == 1'100);
}

void test_unit_converter() {
  const auto converter = ledger::UnitConverter::from_decimals(6, 8);
  assert(converter.scale() == ledger::UnitConverter::kDefaultScale);
  assert(converter.to_cap_units(500'000000) == common::Amount{500'00000000});
  assert(!converter.to_cap_units(std::numeric_limits<common::Amount>::max()).has_value());

  assert(ledger::UnitConverter::from_decimals(6, 6).scale() == 1);

  bool threw = false;
  try {
    (void)ledger::UnitConverter::from_decimals(8, 6);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace swapvault::tests
