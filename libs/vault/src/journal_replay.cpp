#include "swapvault/vault/journal_replay.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "swapvault/journal/journal.hpp"
#include "swapvault/vault/events.hpp"

namespace swapvault {
namespace vault {

namespace {

[[noreturn]] void diverged(std::uint64_t sequence, common::Status status) {
  throw std::runtime_error("journal replay diverged at sequence " + std::to_string(sequence) + ": " +
                           std::string(common::to_string(status)));
}

}  // namespace

ReplayStats replay_journal(const std::filesystem::path& path, ledger::Ledger& ledger,
                           auth::AccessControl& access) {
  ReplayStats stats;
  journal::Reader reader(path);
  journal::Record record;

  while (reader.next(record)) {
    ++stats.records;
    stats.last_sequence = record.header.sequence;

    const auto event = decode_event(record.header.kind, record.payload);
    if (!event) {
      throw std::runtime_error("undecodable journal record at sequence " +
                               std::to_string(record.header.sequence));
    }

    std::visit(
        [&](const auto& ev) {
          using T = std::decay_t<decltype(ev)>;
          if constexpr (std::is_same_v<T, DepositCompleted>) {
            const auto credited = ledger.credit(ev.receipt.user, ev.receipt.reference_credited);
            if (credited.status != common::Status::kOk) {
              diverged(record.header.sequence, credited.status);
            }
            ++stats.deposits;
          } else if constexpr (std::is_same_v<T, WithdrawalCompleted>) {
            const auto debited = ledger.debit(ev.user, ev.amount);
            if (debited != common::Status::kOk) {
              diverged(record.header.sequence, debited);
            }
            ++stats.withdrawals;
          } else if constexpr (std::is_same_v<T, CapUpdated>) {
            ledger.set_bank_cap(ev.after);
            ++stats.cap_updates;
          } else if constexpr (std::is_same_v<T, PauseChanged>) {
            (void)access.set_paused(ev.paused);
            ++stats.pause_changes;
          } else if constexpr (std::is_same_v<T, AdminAccepted>) {
            if (!access.restore_nonce(ev.caller, ev.nonce)) {
              std::fprintf(stderr, "journal replay: admin %llu is no longer registered (sequence %llu)\n",
                           static_cast<unsigned long long>(ev.caller),
                           static_cast<unsigned long long>(record.header.sequence));
            }
            ++stats.admin_commands;
          }
        },
        *event);
  }

  return stats;
}

}  // namespace vault
}  // namespace swapvault
