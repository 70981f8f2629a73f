#include "test_deposit.hpp"

#include <cassert>
#include <variant>

#include "swapvault/amm/swap_math.hpp"
#include "vault_fixture.hpp"

namespace swapvault::tests {

void test_deposit_swap_path() {
  VaultFixture fx;
  fx.book.mint(kWeth, kAlice, 1'00000000);

  const auto quote = fx.vault.quote(kWeth, 1'00000000);
  assert(quote.status == common::Status::kOk);
  assert(!quote.direct);
  assert(quote.reference_out == amm::expected_out(1'00000000, kWethReserve, kUsdReserve).amount_out);
  assert(quote.cap_units == quote.reference_out * 100);

  const auto result = fx.vault.deposit(kAlice, kWeth, 1'00000000, quote.reference_out);
  assert(result.status == common::Status::kOk);
  assert(result.reject_code == 0);
  assert(result.estimate == quote.reference_out);
  assert(result.receipt.user == kAlice);
  assert(result.receipt.asset_in == kWeth);
  assert(result.receipt.amount_in == 1'00000000);
  assert(result.receipt.reference_credited == quote.reference_out);

  assert(fx.vault.balance_of(kAlice) == quote.reference_out);
  assert(fx.book.balance_of(kUsd, kCustody) == quote.reference_out);
  assert(fx.book.balance_of(kWeth, kCustody) == 0);
  assert(fx.book.balance_of(kWeth, kAlice) == 0);

  const auto totals = fx.vault.totals();
  assert(totals.total_held == quote.reference_out);
  assert(totals.total_deposited == quote.cap_units);
  assert(totals.operation_count == 1);

  const auto events = fx.vault.drain_events();
  assert(events.size() == 1);
  const auto* completed = std::get_if<vault::DepositCompleted>(&events.front());
  assert(completed != nullptr);
  assert(completed->receipt.reference_credited == quote.reference_out);
  assert(fx.vault.drain_events().empty());
}

void test_deposit_direct_path() {
  // No pools at all: the reference asset never touches one.
  VaultFixture fx({.with_pools = false});
  fx.book.mint(kUsd, kAlice, 500'000000);

  const auto quote = fx.vault.quote(kUsd, 500'000000);
  assert(quote.status == common::Status::kOk);
  assert(quote.direct);
  assert(quote.cap_units == 500'00000000);

  const auto result = fx.vault.deposit(kAlice, kUsd, 500'000000, 0);
  assert(result.status == common::Status::kOk);
  assert(result.receipt.reference_credited == 500'000000);
  assert(fx.vault.balance_of(kAlice) == 500'000000);
  assert(fx.book.balance_of(kUsd, kCustody) == 500'000000);

  const auto totals = fx.vault.totals();
  assert(totals.total_deposited == 500'00000000);
  assert(totals.total_held == 500'000000);

  // The minimum only guards a swap.
  fx.book.mint(kUsd, kAlice, 1'000000);
  assert(fx.vault.deposit(kAlice, kUsd, 1'000000, 5'000000).status == common::Status::kOk);
  assert(fx.vault.balance_of(kAlice) == 501'000000);
}

void test_deposit_fee_on_transfer_asset() {
  VaultFixture fx;
  fx.book.mint(kFot, kAlice, 1'000);

  // 1000 -> 950 into custody -> 903 into the pair.
  const auto result = fx.vault.deposit(kAlice, kFot, 1'000, 0);
  assert(result.status == common::Status::kOk);
  assert(result.receipt.amount_in == 1'000);
  assert(result.estimate == amm::expected_out(950, kFotReserve, kFotUsdReserve).amount_out);
  assert(result.receipt.reference_credited == amm::expected_out(903, kFotReserve, kFotUsdReserve).amount_out);
  assert(result.receipt.reference_credited == 1'798);
  assert(fx.vault.balance_of(kAlice) == 1'798);
  assert(fx.book.balance_of(kFot, kCustody) == 0);
}

void test_deposit_shortfall_leaves_pool_untouched() {
  VaultFixture fx;
  fx.book.mint(kFot, kAlice, 1'000);

  // The minimum is fair for what custody receives (950), but only 903 reaches the pair.
  const auto fair = fx.vault.quote(kFot, 950);
  assert(fair.reference_out == 1'892);
  const auto reserves_before = fx.pairs.find(kFot, kUsd)->reserves();

  const auto result = fx.vault.deposit(kAlice, kFot, 1'000, fair.reference_out);
  assert(result.status == common::Status::kInsufficientOutputAmount);
  assert(result.estimate == 1'892);
  assert(result.receipt.reference_credited == 0);

  const auto reserves_after = fx.pairs.find(kFot, kUsd)->reserves();
  assert(reserves_after.reserve0 == reserves_before.reserve0);
  assert(reserves_after.reserve1 == reserves_before.reserve1);
  assert(fx.book.balance_of(kFot, kFotPool) == kFotReserve);
  assert(fx.book.balance_of(kUsd, kFotPool) == kFotUsdReserve);

  // 903 handed back by the pair, less 5% on the way out.
  assert(result.uncredited.asset == kFot);
  assert(result.uncredited.amount == 858);
  assert(fx.book.balance_of(kFot, kCustody) == 858);
  assert(fx.book.balance_of(kUsd, kCustody) == 0);
  assert(fx.vault.balance_of(kAlice) == 0);
  assert(fx.vault.totals().total_held == 0);

  const auto events = fx.vault.drain_events();
  assert(events.size() == 1);
  const auto& failed = std::get<vault::DepositFailed>(events.front());
  assert(failed.asset_stranded == kFot);
  assert(failed.amount_stranded == 858);
}

void test_deposit_failure_leaves_ledger_unchanged() {
  VaultFixture fx({.bank_cap = 100});
  fx.book.mint(kUsd, kBob, 1);
  assert(fx.vault.deposit(kBob, kUsd, 1, 0).status == common::Status::kOk);
  fx.vault.drain_events();

  const auto before = fx.vault.totals();
  const auto quote = fx.vault.quote(kWeth, 1'00000000);
  fx.book.mint(kWeth, kAlice, 3'00000000);

  // Estimate below the caller's minimum: nothing leaves custody.
  const auto reserves_before = fx.pairs.find(kWeth, kUsd)->reserves();
  const auto too_greedy = fx.vault.deposit(kAlice, kWeth, 1'00000000, quote.reference_out + 1);
  assert(too_greedy.status == common::Status::kInsufficientOutputAmount);
  assert(too_greedy.reject_code == common::reject_code(common::Status::kInsufficientOutputAmount));
  assert(too_greedy.estimate == quote.reference_out);
  assert(fx.pairs.find(kWeth, kUsd)->reserves().reserve0 == reserves_before.reserve0);
  assert(fx.book.balance_of(kWeth, kCustody) == 1'00000000);

  // Swap succeeds, credit does not fit under the cap.
  const auto over_cap = fx.vault.deposit(kAlice, kWeth, 1'00000000, 0);
  assert(over_cap.status == common::Status::kCapExceeded);
  assert(over_cap.credit.cap == 100);
  assert(over_cap.credit.new_total > 100);
  assert(over_cap.receipt.reference_credited == 0);
  // The swap ran, so custody holds its reference output, not the input.
  assert(over_cap.uncredited.asset == kUsd);
  assert(over_cap.uncredited.amount == over_cap.credit.new_total / 100 - 1);
  assert(fx.book.balance_of(kUsd, kCustody) == 1 + over_cap.uncredited.amount);
  assert(fx.book.balance_of(kWeth, kCustody) == 1'00000000);

  // No pool for this asset.
  fx.book.mint(kLone, kAlice, 1'000);
  assert(fx.vault.deposit(kAlice, kLone, 1'000, 0).status == common::Status::kPairNotFound);

  const auto after = fx.vault.totals();
  assert(after.total_deposited == before.total_deposited);
  assert(after.total_held == before.total_held);
  assert(after.operation_count == before.operation_count);
  assert(fx.vault.balance_of(kAlice) == 0);
  assert(fx.vault.balance_of(kBob) == 1);

  // Pulled input stays in custody and is reported.
  const auto events = fx.vault.drain_events();
  assert(events.size() == 3);
  for (const auto& event : events) {
    assert(std::holds_alternative<vault::DepositFailed>(event));
  }
  const auto& greedy_left = std::get<vault::DepositFailed>(events[0]);
  assert(greedy_left.asset_stranded == kWeth);
  assert(greedy_left.amount_stranded == 1'00000000);
  const auto& swapped_left = std::get<vault::DepositFailed>(events[1]);
  assert(swapped_left.asset_stranded == kUsd);
  assert(swapped_left.amount_stranded == over_cap.uncredited.amount);
  assert(swapped_left.status == common::Status::kCapExceeded);
  const auto& stranded = std::get<vault::DepositFailed>(events[2]);
  assert(stranded.asset_stranded == kLone);
  assert(stranded.amount_stranded == 1'000);
  assert(stranded.status == common::Status::kPairNotFound);
  assert(fx.book.balance_of(kLone, kCustody) == 1'000);
}

void test_deposit_rejects_reentry_during_swap() {
  VaultFixture fx;
  fx.book.mint(kWeth, kAlice, 1'00000000);
  fx.book.mint(kUsd, kBob, 10'000000);

  common::Status inner_deposit = common::Status::kOk;
  common::Status inner_withdraw = common::Status::kOk;
  fx.pairs.find(kWeth, kUsd)->set_swap_hook([&] {
    inner_deposit = fx.vault.deposit(kBob, kUsd, 10'000000, 0).status;
    inner_withdraw = fx.vault.withdraw(kAlice, 1).status;
  });

  const auto result = fx.vault.deposit(kAlice, kWeth, 1'00000000, 0);
  assert(result.status == common::Status::kOk);
  assert(inner_deposit == common::Status::kReentrantCall);
  assert(inner_withdraw == common::Status::kReentrantCall);
  assert(fx.book.balance_of(kUsd, kBob) == 10'000000);
  assert(fx.vault.balance_of(kBob) == 0);
  assert(fx.vault.balance_of(kAlice) == result.receipt.reference_credited);

  // The guard is released once the swap returns.
  fx.pairs.find(kWeth, kUsd)->set_swap_hook({});
  assert(fx.vault.deposit(kBob, kUsd, 10'000000, 0).status == common::Status::kOk);
}

void test_deposit_native() {
  VaultFixture fx({.with_native = true});
  fx.book.mint(common::kNativeAsset, kAlice, 1'00000000);

  const auto expected = amm::expected_out(1'00000000, kWethReserve, kUsdReserve).amount_out;
  const auto result = fx.vault.deposit_native(kAlice, 1'00000000, expected);
  assert(result.status == common::Status::kOk);
  assert(result.receipt.asset_in == kWeth);
  assert(result.receipt.reference_credited == expected);
  assert(fx.vault.balance_of(kAlice) == expected);
  assert(fx.book.balance_of(common::kNativeAsset, kEscrow) == 1'00000000);
  assert(fx.book.balance_of(common::kNativeAsset, kAlice) == 0);

  // Payment the wrapper cannot take fails the whole deposit.
  const auto unfunded = fx.vault.deposit_native(kBob, 5, 0);
  assert(unfunded.status == common::Status::kWrapFailed);
  assert(fx.vault.balance_of(kBob) == 0);

  VaultFixture no_wrapper;
  no_wrapper.book.mint(common::kNativeAsset, kAlice, 1'00000000);
  assert(no_wrapper.vault.deposit_native(kAlice, 1'00000000, 0).status == common::Status::kWrapFailed);
  assert(no_wrapper.book.balance_of(common::kNativeAsset, kAlice) == 1'00000000);
}

void test_deposit_input_checks() {
  VaultFixture fx;
  fx.book.mint(kUsd, kAlice, 1'000000);

  assert(fx.vault.deposit(common::kZeroAccount, kUsd, 1, 0).status == common::Status::kInvalidInput);
  assert(fx.vault.deposit(kAlice, kUsd, 0, 0).status == common::Status::kInvalidInput);
  assert(fx.vault.quote(kUsd, 0).status == common::Status::kInvalidInput);
  assert(fx.vault.quote(kLone, 1).status == common::Status::kPairNotFound);

  // Cannot pull what the user does not hold.
  const auto unfunded = fx.vault.deposit(kBob, kUsd, 1'000000, 0);
  assert(unfunded.status == common::Status::kTransferFailed);
  assert(fx.vault.drain_events().empty());

  assert(fx.admin(auth::AdminAction::kPause).status == common::Status::kOk);
  assert(fx.vault.is_paused());
  const auto paused = fx.vault.deposit(kAlice, kUsd, 1'000000, 0);
  assert(paused.status == common::Status::kSystemPaused);
  assert(paused.reject_code == common::reject_code(common::Status::kSystemPaused));
  assert(fx.book.balance_of(kUsd, kAlice) == 1'000000);
  assert(fx.vault.quote(kUsd, 1).status == common::Status::kOk);

  assert(fx.admin(auth::AdminAction::kUnpause).status == common::Status::kOk);
  assert(fx.vault.deposit(kAlice, kUsd, 1'000000, 0).status == common::Status::kOk);
}

}  // namespace swapvault::tests
