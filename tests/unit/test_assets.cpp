#include "test_assets.hpp"

#include <cassert>
#include <stdexcept>

#include "vault_fixture.hpp"

namespace swapvault::tests {

void test_token_book_fees() {
  VaultFixture fx({.with_pools = false});
  assert(fx.book.has_asset(kFot));
  assert(!fx.book.has_asset(99));
  assert(fx.book.balance_of(99, kAlice) == 0);

  fx.book.mint(kFot, kAlice, 1'000);
  assert(fx.book.total_supply(kFot) == 1'000);

  // The fee never reaches the recipient and leaves supply.
  fx.book.transfer(kFot, kAlice, kBob, 1'000);
  assert(fx.book.balance_of(kFot, kAlice) == 0);
  assert(fx.book.balance_of(kFot, kBob) == 950);
  assert(fx.book.total_supply(kFot) == 950);

  // Fees round down; a fee-free asset moves in full.
  fx.book.transfer(kFot, kBob, kAlice, 19);
  assert(fx.book.balance_of(kFot, kAlice) == 19);
  assert(fx.book.total_supply(kFot) == 950);
  fx.book.mint(kUsd, kAlice, 10);
  fx.book.transfer(kUsd, kAlice, kBob, 10);
  assert(fx.book.balance_of(kUsd, kBob) == 10);
  assert(fx.book.total_supply(kUsd) == 10);

  bool threw = false;
  try {
    fx.book.transfer(kUsd, kAlice, kBob, 1);
  } catch (const assets::TransferError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    fx.book.transfer(kUsd, kBob, common::kZeroAccount, 1);
  } catch (const assets::TransferError&) {
    threw = true;
  }
  assert(threw);
  assert(fx.book.balance_of(kUsd, kBob) == 10);

  threw = false;
  try {
    (void)fx.book.total_supply(99);
  } catch (const assets::TransferError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    fx.book.register_asset(98, {.symbol = "BAD", .decimals = 6, .transfer_fee_basis_points = 10'001});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(!fx.book.has_asset(98));
}

void test_native_wrapper_round_trip() {
  VaultFixture fx({.with_pools = false});
  fx.book.mint(common::kNativeAsset, kAlice, 500);

  assert(fx.wrapper.wrapped_asset() == kWeth);
  assert(fx.wrapper.wrap(kAlice, kBob, 500) == 500);
  assert(fx.book.balance_of(kWeth, kBob) == 500);
  assert(fx.book.balance_of(common::kNativeAsset, kEscrow) == 500);
  assert(fx.book.total_supply(kWeth) == 500);

  fx.wrapper.unwrap(kBob, kAlice, 200);
  assert(fx.book.balance_of(kWeth, kBob) == 300);
  assert(fx.book.balance_of(common::kNativeAsset, kAlice) == 200);
  assert(fx.book.balance_of(common::kNativeAsset, kEscrow) == 300);
  assert(fx.book.total_supply(kWeth) == 300);

  // More than the holder has: nothing burned, nothing released.
  bool threw = false;
  try {
    fx.wrapper.unwrap(kBob, kAlice, 301);
  } catch (const assets::TransferError&) {
    threw = true;
  }
  assert(threw);
  assert(fx.book.balance_of(kWeth, kBob) == 300);
  assert(fx.book.balance_of(common::kNativeAsset, kEscrow) == 300);

  // Escrow short of native: the burn is undone.
  fx.book.mint(kWeth, kAlice, 1'000);
  threw = false;
  try {
    fx.wrapper.unwrap(kAlice, kAlice, 1'000);
  } catch (const assets::TransferError&) {
    threw = true;
  }
  assert(threw);
  assert(fx.book.balance_of(kWeth, kAlice) == 1'000);
  assert(fx.book.total_supply(kWeth) == 1'300);
}

}  // namespace swapvault::tests
