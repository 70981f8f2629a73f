#include "swapvault/assets/token_book.hpp"

#include <utility>

#include "swapvault/common/checked_math.hpp"

namespace swapvault {
namespace assets {

namespace {
constexpr common::Amount kBasisPointDenominator = 10'000;

common::Amount transfer_fee(common::Amount amount, std::uint32_t basis_points) {
  // Floor of amount * bp / 10'000 without forming the full product.
  const auto wide = static_cast<common::Wide>(amount) * basis_points;
  return static_cast<common::Amount>(wide / kBasisPointDenominator);
}
}  // namespace

void TokenBook::register_asset(common::AssetId asset, AssetInfo info) {
  if (info.transfer_fee_basis_points > kBasisPointDenominator) {
    throw std::invalid_argument("transfer fee above 100%: " + info.symbol);
  }
  std::scoped_lock lock(mutex_);
  auto [it, inserted] = assets_.try_emplace(asset, AssetState{.info = info});
  if (!inserted) {
    it->second.info = std::move(info);
  }
}

bool TokenBook::has_asset(common::AssetId asset) const {
  std::scoped_lock lock(mutex_);
  return assets_.find(asset) != assets_.end();
}

AssetInfo TokenBook::info(common::AssetId asset) const {
  std::scoped_lock lock(mutex_);
  return require_asset(asset).info;
}

void TokenBook::mint(common::AssetId asset, common::AccountId to, common::Amount amount) {
  std::scoped_lock lock(mutex_);
  auto& state = require_asset(asset);
  const auto supply = common::checked_add(state.supply, amount);
  const auto balance = common::checked_add(state.balances[to], amount);
  if (!supply || !balance) {
    throw TransferError("mint overflows supply of " + state.info.symbol);
  }
  state.supply = *supply;
  state.balances[to] = *balance;
}

void TokenBook::burn(common::AssetId asset, common::AccountId from, common::Amount amount) {
  std::scoped_lock lock(mutex_);
  auto& state = require_asset(asset);
  auto& balance = state.balances[from];
  if (balance < amount) {
    throw TransferError("burn exceeds balance of " + state.info.symbol);
  }
  balance -= amount;
  state.supply -= amount;
}

common::Amount TokenBook::balance_of(common::AssetId asset, common::AccountId holder) const {
  std::scoped_lock lock(mutex_);
  auto it = assets_.find(asset);
  if (it == assets_.end()) {
    return 0;
  }
  if (auto bal = it->second.balances.find(holder); bal != it->second.balances.end()) {
    return bal->second;
  }
  return 0;
}

void TokenBook::transfer(common::AssetId asset, common::AccountId from,
                         common::AccountId to, common::Amount amount) {
  std::scoped_lock lock(mutex_);
  auto& state = require_asset(asset);
  if (to == common::kZeroAccount) {
    throw TransferError("transfer to zero account");
  }
  auto& sender = state.balances[from];
  if (sender < amount) {
    throw TransferError("insufficient " + state.info.symbol + " balance");
  }

  const common::Amount fee = transfer_fee(amount, state.info.transfer_fee_basis_points);
  const common::Amount delivered = amount - fee;
  sender -= amount;
  state.balances[to] += delivered;  // bounded by supply
  state.supply -= fee;
}

common::Amount TokenBook::total_supply(common::AssetId asset) const {
  std::scoped_lock lock(mutex_);
  return require_asset(asset).supply;
}

TokenBook::AssetState& TokenBook::require_asset(common::AssetId asset) {
  auto it = assets_.find(asset);
  if (it == assets_.end()) {
    throw TransferError("unknown asset " + std::to_string(asset));
  }
  return it->second;
}

const TokenBook::AssetState& TokenBook::require_asset(common::AssetId asset) const {
  auto it = assets_.find(asset);
  if (it == assets_.end()) {
    throw TransferError("unknown asset " + std::to_string(asset));
  }
  return it->second;
}

}  // namespace assets
}  // namespace swapvault
