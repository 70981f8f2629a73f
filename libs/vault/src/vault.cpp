#include "swapvault/vault/vault.hpp"

#include <chrono>
#include <utility>

#include "swapvault/common/time_utils.hpp"

namespace swapvault {
namespace vault {

namespace {

DepositResult deposit_rejected(common::Status status, common::AccountId user,
                               common::AssetId asset, common::Amount amount) {
  return DepositResult{
      .status = status,
      .reject_code = common::reject_code(status),
      .receipt = {.user = user, .asset_in = asset, .amount_in = amount, .reference_credited = 0},
      .estimate = 0,
      .credit = {},
  };
}

AdminResult admin_result(common::Status status, common::Amount before = 0, common::Amount after = 0) {
  return AdminResult{
      .status = status,
      .reject_code = common::reject_code(status),
      .before = before,
      .after = after,
  };
}

}  // namespace

Vault::Vault(VaultSettings settings,
             ledger::Ledger& ledger,
             assets::AssetTransfer& assets,
             pool::PairRegistry& pairs,
             auth::AccessControl& access,
             VaultServices services)
    : settings_(settings),
      ledger_(ledger),
      assets_(assets),
      access_(access),
      services_(services),
      adapter_(pairs, assets, settings.custody_account),
      orchestrator_(ledger, adapter_, access, custody_, settings.reference_asset, settings.custody_account),
      withdrawals_(ledger, assets, access, custody_, settings.reference_asset, settings.custody_account) {}

DepositResult Vault::deposit(common::AccountId user, common::AssetId asset,
                             common::Amount amount, common::Amount min_reference_out) {
  const auto started = common::now_steady();
  std::scoped_lock lock(custody_.mutex);

  // Refuse before pulling anything so nothing is stranded by a rejected call.
  if (custody_.swap_in_progress) {
    count(telemetry::Metric::kDepositRejected);
    return deposit_rejected(common::Status::kReentrantCall, user, asset, amount);
  }
  if (access_.is_paused()) {
    count(telemetry::Metric::kDepositRejected);
    return deposit_rejected(common::Status::kSystemPaused, user, asset, amount);
  }
  if (user == common::kZeroAccount || amount == 0) {
    count(telemetry::Metric::kDepositRejected);
    return deposit_rejected(common::Status::kInvalidInput, user, asset, amount);
  }

  const common::Amount custody_before = assets_.balance_of(asset, settings_.custody_account);
  try {
    assets_.transfer(asset, user, settings_.custody_account, amount);
  } catch (const assets::TransferError&) {
    count(telemetry::Metric::kDepositRejected);
    return deposit_rejected(common::Status::kTransferFailed, user, asset, amount);
  }
  const common::Amount custody_after = assets_.balance_of(asset, settings_.custody_account);
  const common::Amount received = custody_after > custody_before ? custody_after - custody_before : 0;
  if (received == 0) {
    count(telemetry::Metric::kDepositRejected);
    return deposit_rejected(common::Status::kZeroEffectiveInput, user, asset, amount);
  }
  if (asset == settings_.reference_asset) {
    custody_.reference_in += received;
  }

  auto result = run_deposit(user, asset, amount, received, min_reference_out);
  if (services_.telemetry) {
    services_.telemetry->record_latency(telemetry::Metric::kDepositLatency, common::now_steady() - started);
  }
  return result;
}

DepositResult Vault::deposit_native(common::AccountId user, common::Amount amount,
                                    common::Amount min_reference_out) {
  const auto started = common::now_steady();
  std::scoped_lock lock(custody_.mutex);

  if (!services_.native_wrapper) {
    count(telemetry::Metric::kDepositRejected);
    return deposit_rejected(common::Status::kWrapFailed, user, common::kNativeAsset, amount);
  }
  const common::AssetId wrapped = services_.native_wrapper->wrapped_asset();

  if (custody_.swap_in_progress) {
    count(telemetry::Metric::kDepositRejected);
    return deposit_rejected(common::Status::kReentrantCall, user, wrapped, amount);
  }
  if (access_.is_paused()) {
    count(telemetry::Metric::kDepositRejected);
    return deposit_rejected(common::Status::kSystemPaused, user, wrapped, amount);
  }
  if (user == common::kZeroAccount || amount == 0) {
    count(telemetry::Metric::kDepositRejected);
    return deposit_rejected(common::Status::kInvalidInput, user, wrapped, amount);
  }

  common::Amount received = 0;
  try {
    received = services_.native_wrapper->wrap(user, settings_.custody_account, amount);
  } catch (const assets::TransferError&) {
    count(telemetry::Metric::kDepositRejected);
    return deposit_rejected(common::Status::kWrapFailed, user, wrapped, amount);
  }

  if (wrapped == settings_.reference_asset) {
    custody_.reference_in += received;
  }
  auto result = run_deposit(user, wrapped, amount, received, min_reference_out);
  if (services_.telemetry) {
    services_.telemetry->record_latency(telemetry::Metric::kDepositLatency, common::now_steady() - started);
  }
  return result;
}

DepositResult Vault::run_deposit(common::AccountId user, common::AssetId asset,
                                 common::Amount amount, common::Amount received,
                                 common::Amount min_reference_out) {
  DepositResult result = orchestrator_.execute(DepositRequest{
      .user = user,
      .asset_in = asset,
      .amount_in = received,
      .min_reference_out = min_reference_out,
  });
  result.receipt.amount_in = amount;

  if (result.status != common::Status::kOk) {
    count(telemetry::Metric::kDepositRejected);
    emit(DepositFailed{
        .user = user,
        .asset_stranded = result.uncredited.asset,
        .amount_stranded = result.uncredited.amount,
        .status = result.status,
    });
    return result;
  }

  count(telemetry::Metric::kDepositAccepted);
  emit(DepositCompleted{.receipt = result.receipt});
  return result;
}

WithdrawalResult Vault::withdraw(common::AccountId user, common::Amount amount) {
  const auto started = common::now_steady();
  std::scoped_lock lock(custody_.mutex);

  WithdrawalResult result = withdrawals_.withdraw(user, amount);
  if (result.status != common::Status::kOk) {
    count(telemetry::Metric::kWithdrawalRejected);
    return result;
  }

  count(telemetry::Metric::kWithdrawalAccepted);
  emit(WithdrawalCompleted{.user = user, .amount = amount, .balance_after = result.balance_after});
  if (services_.telemetry) {
    services_.telemetry->record_latency(telemetry::Metric::kWithdrawalLatency, common::now_steady() - started);
  }
  return result;
}

AdminResult Vault::administer(const auth::AdminCommand& command, const auth::Signature& signature) {
  std::scoped_lock lock(custody_.mutex);

  const common::Status authorized = access_.authorize(command, signature);
  if (authorized != common::Status::kOk) {
    count(telemetry::Metric::kAdminRejected);
    return admin_result(authorized);
  }
  emit(AdminAccepted{.caller = command.caller, .nonce = command.nonce, .action = command.action});

  AdminResult result;
  switch (command.action) {
    case auth::AdminAction::kSetBankCap: {
      const common::Amount before = ledger_.set_bank_cap(command.amount);
      emit(CapUpdated{.before = before, .after = command.amount});
      result = admin_result(common::Status::kOk, before, command.amount);
      break;
    }
    case auth::AdminAction::kPause:
    case auth::AdminAction::kUnpause: {
      const bool pause = command.action == auth::AdminAction::kPause;
      const bool before = access_.set_paused(pause);
      if (before != pause) {
        emit(PauseChanged{.paused = pause});
      }
      result = admin_result(common::Status::kOk, before ? 1 : 0, pause ? 1 : 0);
      break;
    }
    case auth::AdminAction::kRescue:
      result = rescue(command);
      break;
    default:
      result = admin_result(common::Status::kInvalidInput);
      break;
  }

  count(result.status == common::Status::kOk ? telemetry::Metric::kAdminAccepted
                                             : telemetry::Metric::kAdminRejected);
  return result;
}

AdminResult Vault::rescue(const auth::AdminCommand& command) {
  if (custody_.swap_in_progress) {
    return admin_result(common::Status::kReentrantCall);
  }
  if (command.target == common::kZeroAccount || command.amount == 0) {
    return admin_result(common::Status::kInvalidInput);
  }

  const common::Amount custody_balance = assets_.balance_of(command.asset, settings_.custody_account);
  common::Amount available = custody_balance;
  if (command.asset == settings_.reference_asset) {
    // Balances owed to users stay in custody.
    const common::Amount held = ledger_.totals().total_held;
    available = custody_balance > held ? custody_balance - held : 0;
  }
  if (command.amount > available) {
    return admin_result(common::Status::kInsufficientBalance, available, available);
  }

  try {
    assets_.transfer(command.asset, settings_.custody_account, command.target, command.amount);
  } catch (const assets::TransferError&) {
    return admin_result(common::Status::kTransferFailed, available, available);
  }

  const common::Amount custody_after = assets_.balance_of(command.asset, settings_.custody_account);
  if (command.asset == settings_.reference_asset && custody_balance > custody_after) {
    custody_.reference_out += custody_balance - custody_after;
  }
  emit(RescueCompleted{.asset = command.asset, .to = command.target, .amount = command.amount});
  return admin_result(common::Status::kOk, custody_balance, custody_after);
}

QuoteResult Vault::quote(common::AssetId asset, common::Amount amount) const {
  return orchestrator_.quote(asset, amount);
}

std::vector<Event> Vault::drain_events() {
  std::scoped_lock lock(events_mutex_);
  auto copy = std::move(events_);
  events_.clear();
  return copy;
}

void Vault::emit(Event event) {
  if (services_.journal) {
    const auto payload = encode_event(event);
    services_.journal->append(journal::RecordView{.kind = event_kind(event), .payload = payload});
  }
  std::scoped_lock lock(events_mutex_);
  events_.push_back(std::move(event));
}

void Vault::count(telemetry::Metric metric) {
  if (services_.telemetry) {
    services_.telemetry->increment(metric);
  }
}

}  // namespace vault
}  // namespace swapvault
