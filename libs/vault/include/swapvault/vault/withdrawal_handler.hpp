#pragma once

#include <cstdint>

#include "swapvault/assets/token_book.hpp"
#include "swapvault/auth/access_control.hpp"
#include "swapvault/common/status.hpp"
#include "swapvault/common/types.hpp"
#include "swapvault/ledger/ledger.hpp"
#include "swapvault/vault/custody.hpp"

namespace swapvault {
namespace vault {

struct WithdrawalResult {
  common::Status status{common::Status::kOk};
  std::uint16_t reject_code{0};
  common::Amount amount{0};
  common::Amount balance_after{0};
};

// Debit first, transfer second. A transfer that throws or does not take at
// least the amount out of custody puts the debit back before returning.
// Reference flows of vault operations nested inside the transfer are netted
// out of the custody delta first.
class WithdrawalHandler {
 public:
  WithdrawalHandler(ledger::Ledger& ledger,
                    assets::AssetTransfer& assets,
                    const auth::AccessControl& access,
                    Custody& custody,
                    common::AssetId reference_asset,
                    common::AccountId custody_account)
      : ledger_(ledger),
        assets_(assets),
        access_(access),
        custody_(custody),
        reference_asset_(reference_asset),
        custody_account_(custody_account) {}

  WithdrawalResult withdraw(common::AccountId user, common::Amount amount);

 private:
  ledger::Ledger& ledger_;
  assets::AssetTransfer& assets_;
  const auth::AccessControl& access_;
  Custody& custody_;
  common::AssetId reference_asset_;
  common::AccountId custody_account_;

  bool transfer_out(common::AccountId user, common::Amount amount);
};

}  // namespace vault
}  // namespace swapvault
