#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

#include "swapvault/assets/native_wrapper.hpp"
#include "swapvault/assets/token_book.hpp"
#include "swapvault/auth/access_control.hpp"
#include "swapvault/common/status.hpp"
#include "swapvault/common/types.hpp"
#include "swapvault/journal/journal.hpp"
#include "swapvault/ledger/ledger.hpp"
#include "swapvault/pool/pair.hpp"
#include "swapvault/pool/pool_adapter.hpp"
#include "swapvault/telemetry/telemetry_sink.hpp"
#include "swapvault/vault/custody.hpp"
#include "swapvault/vault/deposit_orchestrator.hpp"
#include "swapvault/vault/events.hpp"
#include "swapvault/vault/withdrawal_handler.hpp"

namespace swapvault {
namespace vault {

struct VaultSettings {
  common::AccountId custody_account{common::kZeroAccount};
  common::AssetId reference_asset{0};
};

struct AdminResult {
  common::Status status{common::Status::kOk};
  std::uint16_t reject_code{0};
  common::Amount before{0};
  common::Amount after{0};
};

// Optional collaborators; null members are simply not used.
struct VaultServices {
  assets::NativeWrapper* native_wrapper{nullptr};
  journal::Writer* journal{nullptr};
  telemetry::TelemetrySink* telemetry{nullptr};
};

class Vault {
 public:
  Vault(VaultSettings settings,
        ledger::Ledger& ledger,
        assets::AssetTransfer& assets,
        pool::PairRegistry& pairs,
        auth::AccessControl& access,
        VaultServices services = {});

  Vault(const Vault&) = delete;
  Vault& operator=(const Vault&) = delete;

  // Pulls `amount` of `asset` from the user into custody, then credits the
  // reference-asset value of what actually arrived.
  DepositResult deposit(common::AccountId user, common::AssetId asset,
                        common::Amount amount, common::Amount min_reference_out);

  // Pays native currency through the wrapper, then takes the swap path.
  DepositResult deposit_native(common::AccountId user, common::Amount amount,
                               common::Amount min_reference_out);

  WithdrawalResult withdraw(common::AccountId user, common::Amount amount);

  AdminResult administer(const auth::AdminCommand& command, const auth::Signature& signature);

  [[nodiscard]] QuoteResult quote(common::AssetId asset, common::Amount amount) const;
  [[nodiscard]] common::Amount balance_of(common::AccountId user) const { return ledger_.balance_of(user); }
  [[nodiscard]] ledger::LedgerTotals totals() const { return ledger_.totals(); }
  [[nodiscard]] bool is_paused() const noexcept { return access_.is_paused(); }
  [[nodiscard]] const VaultSettings& settings() const noexcept { return settings_; }

  [[nodiscard]] std::vector<Event> drain_events();

 private:
  VaultSettings settings_;
  ledger::Ledger& ledger_;
  assets::AssetTransfer& assets_;
  auth::AccessControl& access_;
  VaultServices services_;

  Custody custody_{};
  pool::PoolAdapter adapter_;
  DepositOrchestrator orchestrator_;
  WithdrawalHandler withdrawals_;

  std::mutex events_mutex_;
  std::vector<Event> events_{};

  DepositResult run_deposit(common::AccountId user, common::AssetId asset,
                            common::Amount amount, common::Amount received,
                            common::Amount min_reference_out);
  AdminResult rescue(const auth::AdminCommand& command);
  void emit(Event event);
  void count(telemetry::Metric metric);
};

}  // namespace vault
}  // namespace swapvault
