#include "test_pool.hpp"

#include <cassert>

#include "swapvault/amm/swap_math.hpp"
#include "swapvault/pool/pair.hpp"
#include "swapvault/pool/pool_adapter.hpp"
#include "vault_fixture.hpp"

namespace swapvault::tests {

void test_pool_fee_on_transfer_input() {
  VaultFixture fx;
  pool::PoolAdapter adapter(fx.pairs, fx.book, kCustody);
  fx.book.mint(kFot, kCustody, 1'000);

  const auto reserves = adapter.get_reserves(kFot, kUsd);
  assert(reserves.status == common::Status::kOk);
  assert(reserves.reserves.reserve_in == kFotReserve);
  assert(reserves.reserves.reserve_out == kFotUsdReserve);

  const auto nominal = amm::expected_out(1'000, kFotReserve, kFotUsdReserve);
  assert(nominal.amount_out == 1'992);

  const auto outcome = adapter.swap(pool::SwapRequest{
      .asset_in = kFot,
      .asset_out = kUsd,
      .amount_in = 1'000,
      .amount_out_expected = nominal.amount_out,
      .min_amount_out = 0,
      .recipient = kCustody,
  });
  assert(outcome.status == common::Status::kOk);
  // 5% withheld on the way in: the math runs on what the pair received.
  assert(outcome.amount_in_effective == 950);
  assert(outcome.amount_out == amm::expected_out(950, kFotReserve, kFotUsdReserve).amount_out);
  assert(outcome.amount_out == 1'892);
  assert(fx.book.balance_of(kUsd, kCustody) == 1'892);

  const auto after = fx.pairs.find(kFot, kUsd)->reserves();
  assert(after.reserve0 == kFotUsdReserve - 1'892);  // token0 is USD
  assert(after.reserve1 == kFotReserve + 950);
}

void test_pool_missing_and_empty_pairs() {
  VaultFixture fx({.with_pools = false});
  pool::PoolAdapter adapter(fx.pairs, fx.book, kCustody);

  assert(adapter.get_reserves(kLone, kUsd).status == common::Status::kPairNotFound);
  fx.book.mint(kLone, kCustody, 1'000);
  const auto missing = adapter.swap(pool::SwapRequest{
      .asset_in = kLone,
      .asset_out = kUsd,
      .amount_in = 1'000,
      .amount_out_expected = 1,
      .min_amount_out = 0,
      .recipient = kCustody,
  });
  assert(missing.status == common::Status::kPairNotFound);
  assert(missing.reject_code == common::reject_code(common::Status::kPairNotFound));
  assert(fx.book.balance_of(kLone, kCustody) == 1'000);

  fx.pairs.create_pair(kUsd, kLone, 3'000'000);
  assert(adapter.get_reserves(kLone, kUsd).status == common::Status::kInsufficientLiquidity);
  const auto empty = adapter.swap(pool::SwapRequest{
      .asset_in = kLone,
      .asset_out = kUsd,
      .amount_in = 1'000,
      .amount_out_expected = 1,
      .min_amount_out = 0,
      .recipient = kCustody,
  });
  assert(empty.status == common::Status::kInsufficientLiquidity);
  assert(empty.amount_in_effective == 0);
  assert(fx.book.balance_of(kLone, kCustody) == 1'000);
  assert(fx.book.balance_of(kLone, 3'000'000) == 0);

  // An asset that withholds everything delivers nothing to swap with.
  constexpr common::AssetId kVoid = 5;
  fx.book.register_asset(kVoid, {.symbol = "VOID", .decimals = 6, .transfer_fee_basis_points = 10'000});
  auto& void_pair = fx.pairs.create_pair(kVoid, kUsd, 3'000'001);
  fx.book.mint(kVoid, 3'000'001, 1'000'000);
  fx.book.mint(kUsd, 3'000'001, 1'000'000);
  void_pair.sync();
  fx.book.mint(kVoid, kCustody, 1'000);
  const auto nothing = adapter.swap(pool::SwapRequest{
      .asset_in = kVoid,
      .asset_out = kUsd,
      .amount_in = 1'000,
      .amount_out_expected = 996,
      .min_amount_out = 0,
      .recipient = kCustody,
  });
  assert(nothing.status == common::Status::kZeroEffectiveInput);
}

void test_pool_short_output_rejected() {
  VaultFixture fx;
  pool::PoolAdapter adapter(fx.pairs, fx.book, kCustody);
  fx.book.mint(kUsd, kCustody, 10'000);

  const auto quote = amm::expected_out(10'000, kFotUsdReserve, kFotReserve);
  assert(quote.amount_out == 4'960);

  // The pair pays the full quote, but the output asset withholds 5% in transit.
  const auto outcome = adapter.swap(pool::SwapRequest{
      .asset_in = kUsd,
      .asset_out = kFot,
      .amount_in = 10'000,
      .amount_out_expected = quote.amount_out,
      .min_amount_out = quote.amount_out,
      .recipient = kCustody,
  });
  assert(outcome.status == common::Status::kInsufficientOutputAmount);
  assert(outcome.amount_out == 4'960 - 248);
  assert(fx.book.balance_of(kFot, kCustody) == 4'960 - 248);
}

void test_pool_shortfall_rejected_before_trading() {
  VaultFixture fx;
  pool::PoolAdapter adapter(fx.pairs, fx.book, kCustody);
  fx.book.mint(kFot, kCustody, 1'000);

  // Caller expects the nominal quote; only 950 reaches the pair, worth 1892.
  const auto nominal = amm::expected_out(1'000, kFotReserve, kFotUsdReserve);
  const auto outcome = adapter.swap(pool::SwapRequest{
      .asset_in = kFot,
      .asset_out = kUsd,
      .amount_in = 1'000,
      .amount_out_expected = nominal.amount_out,
      .min_amount_out = nominal.amount_out,
      .recipient = kCustody,
  });
  assert(outcome.status == common::Status::kInsufficientOutputAmount);
  assert(outcome.amount_in_effective == 950);
  assert(outcome.amount_out == 0);

  // The 950 comes back, less the 5% withheld on the way out.
  assert(outcome.amount_in_returned == 903);
  assert(fx.book.balance_of(kFot, kCustody) == 903);
  assert(fx.book.balance_of(kUsd, kCustody) == 0);

  const pool::Pair* pair = fx.pairs.find(kFot, kUsd);
  assert(pair->reserves().reserve0 == kFotUsdReserve);
  assert(pair->reserves().reserve1 == kFotReserve);
  assert(fx.book.balance_of(kFot, kFotPool) == kFotReserve);
  assert(fx.book.balance_of(kUsd, kFotPool) == kFotUsdReserve);
}

void test_pair_invariant() {
  VaultFixture fx;
  pool::Pair* pair = fx.pairs.find(kUsd, kWeth);
  assert(pair != nullptr);
  assert(pair == fx.pairs.find(kWeth, kUsd));
  assert(pair->token0() == kUsd);
  assert(pair->token1() == kWeth);
  assert(fx.pairs.size() == 2);

  bool threw = false;
  try {
    fx.pairs.create_pair(kWeth, kUsd, 9);
  } catch (const pool::PoolError&) {
    threw = true;
  }
  assert(threw);

  // Nothing sent in.
  threw = false;
  try {
    pair->swap(10, 0, kBob);
  } catch (const pool::PoolError&) {
    threw = true;
  }
  assert(threw);

  // One WETH in cannot buy almost the whole USD side.
  fx.book.mint(kWeth, kWethPool, 1'00000000);
  threw = false;
  try {
    pair->swap(kUsdReserve - 1, 0, kBob);
  } catch (const pool::PoolError&) {
    threw = true;
  }
  assert(threw);
  assert(fx.book.balance_of(kUsd, kBob) == 0);

  // The fair amount goes through and reserves follow balances.
  const auto fair = amm::expected_out(1'00000000, kWethReserve, kUsdReserve);
  pair->swap(fair.amount_out, 0, kBob);
  assert(fx.book.balance_of(kUsd, kBob) == fair.amount_out);
  assert(pair->reserves().reserve0 == kUsdReserve - fair.amount_out);
  assert(pair->reserves().reserve1 == kWethReserve + 1'00000000);

  // Stray balance is skimmed off without touching reserves.
  fx.book.mint(kUsd, kWethPool, 500);
  pair->skim(kAlice);
  assert(fx.book.balance_of(kUsd, kAlice) == 500);
  assert(fx.book.balance_of(kWeth, kAlice) == 0);
  assert(pair->reserves().reserve0 == kUsdReserve - fair.amount_out);
}

}  // namespace swapvault::tests
