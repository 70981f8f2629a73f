#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "swapvault/common/status.hpp"
#include "swapvault/common/types.hpp"
#include "swapvault/ledger/unit_converter.hpp"

namespace swapvault {
namespace ledger {

struct LedgerTotals {
  common::Amount total_deposited{0};  // cap units, cumulative; withdrawals never lower it
  common::Amount total_held{0};       // native units currently custodied
  common::Amount bank_cap{0};         // cap units
  std::uint64_t operation_count{0};
};

struct CreditResult {
  common::Status status{common::Status::kOk};
  std::uint16_t reject_code{0};
  common::Amount new_total{0};  // cap units the credit would commit
  common::Amount cap{0};
};

// Sole owner of user balances and vault totals. Every method is a critical
// section; a reader never sees a balance without its matching totals.
class Ledger {
 public:
  explicit Ledger(common::Amount bank_cap, UnitConverter converter = UnitConverter{});

  // All-or-nothing: fails kCapExceeded or kArithmeticOverflow without touching state.
  CreditResult credit(common::AccountId user, common::Amount amount_native);

  common::Status debit(common::AccountId user, common::Amount amount_native);

  // Reverts a committed debit whose outbound transfer did not go through.
  // total_deposited and the operation counter are left as they are.
  common::Status restore(common::AccountId user, common::Amount amount_native);

  // Returns the previous cap. Callers gate this behind admin authorization.
  common::Amount set_bank_cap(common::Amount cap);

  [[nodiscard]] common::Amount balance_of(common::AccountId user) const;
  [[nodiscard]] LedgerTotals totals() const;
  [[nodiscard]] std::vector<std::pair<common::AccountId, common::Amount>> balances() const;
  [[nodiscard]] const UnitConverter& converter() const noexcept { return converter_; }

  // Sum of balances equals total_held.
  [[nodiscard]] bool is_solvent() const;

 private:
  mutable std::mutex mutex_;
  const UnitConverter converter_;
  std::unordered_map<common::AccountId, common::Amount> balances_{};
  LedgerTotals totals_{};

  common::Amount balance_of_locked(common::AccountId user) const;
};

}  // namespace ledger
}  // namespace swapvault
