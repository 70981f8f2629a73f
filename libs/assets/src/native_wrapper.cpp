#include "swapvault/assets/native_wrapper.hpp"

namespace swapvault {
namespace assets {

common::Amount NativeWrapper::wrap(common::AccountId payer, common::AccountId beneficiary,
                                   common::Amount amount) {
  const common::Amount escrow_before = book_.balance_of(common::kNativeAsset, escrow_account_);
  book_.transfer(common::kNativeAsset, payer, escrow_account_, amount);
  const common::Amount received = book_.balance_of(common::kNativeAsset, escrow_account_) - escrow_before;
  if (received == 0) {
    throw TransferError("native payment delivered nothing");
  }
  book_.mint(wrapped_asset_, beneficiary, received);
  return received;
}

void NativeWrapper::unwrap(common::AccountId holder, common::AccountId to, common::Amount amount) {
  book_.burn(wrapped_asset_, holder, amount);
  try {
    book_.transfer(common::kNativeAsset, escrow_account_, to, amount);
  } catch (const TransferError&) {
    book_.mint(wrapped_asset_, holder, amount);
    throw;
  }
}

}  // namespace assets
}  // namespace swapvault
