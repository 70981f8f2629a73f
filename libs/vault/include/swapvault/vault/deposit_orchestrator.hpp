#pragma once

#include <cstdint>
#include <variant>

#include "swapvault/auth/access_control.hpp"
#include "swapvault/common/status.hpp"
#include "swapvault/common/types.hpp"
#include "swapvault/ledger/ledger.hpp"
#include "swapvault/pool/pool_adapter.hpp"
#include "swapvault/vault/custody.hpp"
#include "swapvault/vault/events.hpp"

namespace swapvault {
namespace vault {

struct DepositRequest {
  common::AccountId user{common::kZeroAccount};
  common::AssetId asset_in{0};
  common::Amount amount_in{0};          // already held by the custody account
  common::Amount min_reference_out{0};  // ignored on the direct path
};

struct DirectCredit {};

struct SwapThenCredit {
  common::AssetId asset_in{0};
};

using DepositRoute = std::variant<DirectCredit, SwapThenCredit>;

// What a rejected deposit left in custody without a ledger entry behind it.
struct Holding {
  common::AssetId asset{0};
  common::Amount amount{0};
};

struct DepositResult {
  common::Status status{common::Status::kOk};
  std::uint16_t reject_code{0};
  DepositReceipt receipt{};
  common::Amount estimate{0};     // pre-swap estimate; equals amount_in on the direct path
  ledger::CreditResult credit{};  // new_total/cap are set when the ledger was reached
  Holding uncredited{};           // empty on success
};

struct QuoteResult {
  common::Status status{common::Status::kOk};
  std::uint16_t reject_code{0};
  common::Amount reference_out{0};
  common::Amount cap_units{0};
  bool direct{false};
};

// Turns custody-held input into a ledger credit, swapping through the pool
// when the input is not the reference asset.
class DepositOrchestrator {
 public:
  DepositOrchestrator(ledger::Ledger& ledger,
                      pool::PoolAdapter& adapter,
                      const auth::AccessControl& access,
                      Custody& custody,
                      common::AssetId reference_asset,
                      common::AccountId custody_account)
      : ledger_(ledger),
        adapter_(adapter),
        access_(access),
        custody_(custody),
        reference_asset_(reference_asset),
        custody_account_(custody_account) {}

  DepositResult execute(const DepositRequest& request);

  // Read-only preview of what execute would credit at current reserves.
  [[nodiscard]] QuoteResult quote(common::AssetId asset_in, common::Amount amount_in) const;

  [[nodiscard]] DepositRoute route(common::AssetId asset_in) const noexcept;

 private:
  ledger::Ledger& ledger_;
  pool::PoolAdapter& adapter_;
  const auth::AccessControl& access_;
  Custody& custody_;
  common::AssetId reference_asset_;
  common::AccountId custody_account_;

  DepositResult credit(const DepositRequest& request, common::Amount reference_amount, common::Amount estimate);
  DepositResult swap_then_credit(const DepositRequest& request);
};

}  // namespace vault
}  // namespace swapvault
