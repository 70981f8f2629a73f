#pragma once

#include <cstdint>
#include <filesystem>

#include "swapvault/auth/access_control.hpp"
#include "swapvault/ledger/ledger.hpp"

namespace swapvault {
namespace vault {

struct ReplayStats {
  std::uint64_t records{0};
  std::uint64_t deposits{0};
  std::uint64_t withdrawals{0};
  std::uint64_t cap_updates{0};
  std::uint64_t pause_changes{0};
  std::uint64_t admin_commands{0};
  std::uint64_t last_sequence{0};
};

// Rebuilds vault state from its journal in journal order. Completed deposits
// are credited and completed withdrawals debited; cap updates and pause
// changes are applied, and accepted admin nonces are spent again so a signed
// command cannot be replayed after a restart. Failed deposits and rescues are
// counted and skipped.
// Throws std::runtime_error on a corrupt record or when the ledger refuses a
// journaled operation.
ReplayStats replay_journal(const std::filesystem::path& path, ledger::Ledger& ledger,
                           auth::AccessControl& access);

}  // namespace vault
}  // namespace swapvault
