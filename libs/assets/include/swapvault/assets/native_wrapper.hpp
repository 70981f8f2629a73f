#pragma once

#include "swapvault/assets/token_book.hpp"
#include "swapvault/common/types.hpp"

namespace swapvault {
namespace assets {

// Turns native currency into a transferable wrapped asset, one to one. Native
// deposits are escrowed on the wrapper's own account.
class NativeWrapper {
 public:
  NativeWrapper(TokenBook& book, common::AssetId wrapped_asset, common::AccountId escrow_account)
      : book_(book), wrapped_asset_(wrapped_asset), escrow_account_(escrow_account) {}

  // Moves `amount` native from `payer` into escrow and mints the wrapped asset
  // to `beneficiary`. Returns the amount of wrapped asset minted. Throws
  // TransferError if the payer cannot cover the amount.
  common::Amount wrap(common::AccountId payer, common::AccountId beneficiary, common::Amount amount);

  // Burns wrapped asset held by `holder` and releases native to `to`. Throws
  // TransferError, with nothing burned, if either side cannot cover it.
  void unwrap(common::AccountId holder, common::AccountId to, common::Amount amount);

  [[nodiscard]] common::AssetId wrapped_asset() const noexcept { return wrapped_asset_; }

 private:
  TokenBook& book_;
  common::AssetId wrapped_asset_;
  common::AccountId escrow_account_;
};

}  // namespace assets
}  // namespace swapvault
