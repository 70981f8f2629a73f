#include "swapvault/vault/withdrawal_handler.hpp"

#include <mutex>
#include <stdexcept>

#include "swapvault/common/checked_math.hpp"

namespace swapvault {
namespace vault {

namespace {

WithdrawalResult rejected(common::Status status, common::Amount amount, common::Amount balance) {
  return WithdrawalResult{
      .status = status,
      .reject_code = common::reject_code(status),
      .amount = amount,
      .balance_after = balance,
  };
}

}  // namespace

WithdrawalResult WithdrawalHandler::withdraw(common::AccountId user, common::Amount amount) {
  std::scoped_lock lock(custody_.mutex);

  if (custody_.swap_in_progress) {
    return rejected(common::Status::kReentrantCall, amount, ledger_.balance_of(user));
  }
  if (access_.is_paused()) {
    return rejected(common::Status::kSystemPaused, amount, ledger_.balance_of(user));
  }
  if (user == common::kZeroAccount) {
    return rejected(common::Status::kInvalidInput, amount, 0);
  }
  if (amount == 0) {
    return rejected(common::Status::kZeroAmount, amount, ledger_.balance_of(user));
  }

  // Effects before the interaction: a reentrant withdraw sees the lower balance.
  const common::Status debited = ledger_.debit(user, amount);
  if (debited != common::Status::kOk) {
    return rejected(debited, amount, ledger_.balance_of(user));
  }

  if (!transfer_out(user, amount)) {
    const common::Status restored = ledger_.restore(user, amount);
    if (restored != common::Status::kOk) {
      // The debit was taken from this balance a moment ago; it always fits back.
      throw std::logic_error("failed to restore debit after transfer failure");
    }
    return rejected(common::Status::kTransferFailed, amount, ledger_.balance_of(user));
  }

  return WithdrawalResult{
      .status = common::Status::kOk,
      .reject_code = 0,
      .amount = amount,
      .balance_after = ledger_.balance_of(user),
  };
}

bool WithdrawalHandler::transfer_out(common::AccountId user, common::Amount amount) {
  const common::Amount custody_before = assets_.balance_of(reference_asset_, custody_account_);
  const common::Amount in_before = custody_.reference_in;
  const common::Amount out_before = custody_.reference_out;
  try {
    assets_.transfer(reference_asset_, custody_account_, user, amount);
  } catch (const assets::TransferError&) {
    return false;
  }
  const common::Amount custody_after = assets_.balance_of(reference_asset_, custody_account_);

  // Deposits and withdrawals nested inside the transfer moved custody too;
  // only what is left after netting them out counts for this one.
  const common::Wide available = static_cast<common::Wide>(custody_before) +
                                 static_cast<common::Amount>(custody_.reference_in - in_before);
  const common::Wide remaining = static_cast<common::Wide>(custody_after) +
                                 static_cast<common::Amount>(custody_.reference_out - out_before);
  if (available < remaining) {
    return false;
  }
  const auto moved = common::narrow<common::Amount>(available - remaining);
  if (!moved || *moved < amount) {
    return false;
  }
  custody_.reference_out += *moved;
  return true;
}

}  // namespace vault
}  // namespace swapvault
