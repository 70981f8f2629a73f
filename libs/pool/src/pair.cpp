#include "swapvault/pool/pair.hpp"

#include <string>

#include "swapvault/amm/swap_math.hpp"
#include "swapvault/common/checked_math.hpp"

namespace swapvault {
namespace pool {

namespace {

constexpr common::Wide kFeeTaken = amm::kFeeDenominator - amm::kFeeNumerator;

class SwapLock {
 public:
  explicit SwapLock(bool& flag) : flag_(flag) {
    if (flag_) {
      throw PoolError("pair locked");
    }
    flag_ = true;
  }
  ~SwapLock() { flag_ = false; }
  SwapLock(const SwapLock&) = delete;
  SwapLock& operator=(const SwapLock&) = delete;

 private:
  bool& flag_;
};

// balance * 1000 - amount_in * 3
common::Wide fee_adjusted(common::Amount balance, common::Amount amount_in) {
  const auto scaled = common::checked_mul<common::Wide>(balance, amm::kFeeDenominator);
  if (!scaled) {
    throw PoolError("balance overflow");
  }
  return *scaled - static_cast<common::Wide>(amount_in) * kFeeTaken;
}

}  // namespace

Pair::Pair(common::AccountId account, common::AssetId token0, common::AssetId token1,
           assets::AssetTransfer& assets)
    : account_(account), token0_(token0), token1_(token1), assets_(assets) {
  if (token0_ == token1_) {
    throw PoolError("identical pair assets");
  }
}

void Pair::swap(common::Amount amount0_out, common::Amount amount1_out, common::AccountId to) {
  SwapLock lock(locked_);

  if (amount0_out == 0 && amount1_out == 0) {
    throw PoolError("insufficient output amount");
  }
  if (amount0_out >= reserves_.reserve0 || amount1_out >= reserves_.reserve1) {
    throw PoolError("insufficient liquidity");
  }
  if (to == account_) {
    throw PoolError("invalid recipient");
  }

  // Check the invariant against post-transfer balances before anything moves.
  const common::Amount balance0 = assets_.balance_of(token0_, account_) - amount0_out;
  const common::Amount balance1 = assets_.balance_of(token1_, account_) - amount1_out;
  const common::Amount kept0 = reserves_.reserve0 - amount0_out;
  const common::Amount kept1 = reserves_.reserve1 - amount1_out;
  const common::Amount amount0_in = balance0 > kept0 ? balance0 - kept0 : 0;
  const common::Amount amount1_in = balance1 > kept1 ? balance1 - kept1 : 0;
  if (amount0_in == 0 && amount1_in == 0) {
    throw PoolError("insufficient input amount");
  }

  const auto product_after = common::checked_mul(fee_adjusted(balance0, amount0_in),
                                                 fee_adjusted(balance1, amount1_in));
  const auto reserve_product = common::checked_mul<common::Wide>(reserves_.reserve0, reserves_.reserve1);
  const auto product_before = reserve_product
                                  ? common::checked_mul<common::Wide>(*reserve_product,
                                                                      amm::kFeeDenominator * amm::kFeeDenominator)
                                  : std::nullopt;
  if (!product_after || !product_before) {
    throw PoolError("invariant overflow");
  }
  if (*product_after < *product_before) {
    throw PoolError("K");
  }

  if (amount0_out > 0) {
    assets_.transfer(token0_, account_, to, amount0_out);
  }
  if (amount1_out > 0) {
    assets_.transfer(token1_, account_, to, amount1_out);
  }
  if (swap_hook_) {
    swap_hook_();
  }
  sync();
}

void Pair::sync() {
  reserves_.reserve0 = assets_.balance_of(token0_, account_);
  reserves_.reserve1 = assets_.balance_of(token1_, account_);
}

void Pair::skim(common::AccountId to) {
  SwapLock lock(locked_);
  if (to == account_) {
    throw PoolError("invalid recipient");
  }
  const common::Amount balance0 = assets_.balance_of(token0_, account_);
  const common::Amount balance1 = assets_.balance_of(token1_, account_);
  if (balance0 > reserves_.reserve0) {
    assets_.transfer(token0_, account_, to, balance0 - reserves_.reserve0);
  }
  if (balance1 > reserves_.reserve1) {
    assets_.transfer(token1_, account_, to, balance1 - reserves_.reserve1);
  }
}

Pair& PairRegistry::create_pair(common::AssetId asset_a, common::AssetId asset_b,
                                common::AccountId account) {
  const Key key = make_key(asset_a, asset_b);
  if (pairs_.find(key) != pairs_.end()) {
    throw PoolError("pair exists: " + std::to_string(key.first) + "/" + std::to_string(key.second));
  }
  auto pair = std::make_unique<Pair>(account, key.first, key.second, assets_);
  auto& ref = *pair;
  pairs_.emplace(key, std::move(pair));
  return ref;
}

Pair* PairRegistry::find(common::AssetId asset_a, common::AssetId asset_b) {
  auto it = pairs_.find(make_key(asset_a, asset_b));
  if (it == pairs_.end()) {
    return nullptr;
  }
  return it->second.get();
}

const Pair* PairRegistry::find(common::AssetId asset_a, common::AssetId asset_b) const {
  auto it = pairs_.find(make_key(asset_a, asset_b));
  if (it == pairs_.end()) {
    return nullptr;
  }
  return it->second.get();
}

PairRegistry::Key PairRegistry::make_key(common::AssetId asset_a, common::AssetId asset_b) noexcept {
  return asset_a < asset_b ? Key{asset_a, asset_b} : Key{asset_b, asset_a};
}

}  // namespace pool
}  // namespace swapvault
