#pragma once

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <utility>

#include "swapvault/assets/token_book.hpp"
#include "swapvault/common/types.hpp"

namespace swapvault {
namespace pool {

class PoolError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct Reserves {
  common::Amount reserve0{0};
  common::Amount reserve1{0};
};

// Two-asset constant-product venue holding its assets on its own account.
// Inputs are whatever the pair's balance exceeds its recorded reserves by at
// swap time; the fee-adjusted product must not decrease.
class Pair {
 public:
  using SwapHook = std::function<void()>;

  Pair(common::AccountId account, common::AssetId token0, common::AssetId token1,
       assets::AssetTransfer& assets);

  [[nodiscard]] common::AccountId account() const noexcept { return account_; }
  [[nodiscard]] common::AssetId token0() const noexcept { return token0_; }
  [[nodiscard]] common::AssetId token1() const noexcept { return token1_; }
  [[nodiscard]] Reserves reserves() const noexcept { return reserves_; }

  // Throws PoolError on a zero or over-reserve output, a missing input, a
  // product-invariant violation or a reentrant swap.
  void swap(common::Amount amount0_out, common::Amount amount1_out, common::AccountId to);

  // Sets reserves to current balances.
  void sync();

  // Sends whatever the balances exceed the reserves by to `to`. Reserves are
  // left as they were.
  void skim(common::AccountId to);

  // Invoked after the outputs have been sent and before reserves update.
  void set_swap_hook(SwapHook hook) { swap_hook_ = std::move(hook); }

 private:
  common::AccountId account_;
  common::AssetId token0_;
  common::AssetId token1_;
  assets::AssetTransfer& assets_;
  Reserves reserves_{};
  SwapHook swap_hook_{};
  bool locked_{false};
};

class PairRegistry {
 public:
  explicit PairRegistry(assets::AssetTransfer& assets) : assets_(assets) {}

  // Order of the two assets does not matter; token0 is the lower id.
  Pair& create_pair(common::AssetId asset_a, common::AssetId asset_b, common::AccountId account);

  [[nodiscard]] Pair* find(common::AssetId asset_a, common::AssetId asset_b);
  [[nodiscard]] const Pair* find(common::AssetId asset_a, common::AssetId asset_b) const;
  [[nodiscard]] std::size_t size() const noexcept { return pairs_.size(); }

 private:
  using Key = std::pair<common::AssetId, common::AssetId>;
  static Key make_key(common::AssetId asset_a, common::AssetId asset_b) noexcept;

  assets::AssetTransfer& assets_;
  std::map<Key, std::unique_ptr<Pair>> pairs_{};
};

}  // namespace pool
}  // namespace swapvault
