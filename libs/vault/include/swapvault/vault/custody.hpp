#pragma once

#include <mutex>

#include "swapvault/common/types.hpp"

namespace swapvault {
namespace vault {

// Serializes every operation that moves assets in or out of the custody
// account, so balance-delta measurements are never interleaved. Recursive so a
// counterparty called from inside an operation can reach the vault again and be
// refused by the vault's own checks instead of deadlocking.
struct Custody {
  std::recursive_mutex mutex;
  bool swap_in_progress{false};  // guarded by mutex
  // Running totals of reference asset the vault itself moved in and out of
  // custody. Unsigned wrap-around keeps differences exact.
  common::Amount reference_in{0};   // guarded by mutex
  common::Amount reference_out{0};  // guarded by mutex
};

class SwapInProgress {
 public:
  explicit SwapInProgress(Custody& custody) : custody_(custody) { custody_.swap_in_progress = true; }
  ~SwapInProgress() { custody_.swap_in_progress = false; }
  SwapInProgress(const SwapInProgress&) = delete;
  SwapInProgress& operator=(const SwapInProgress&) = delete;

 private:
  Custody& custody_;
};

}  // namespace vault
}  // namespace swapvault
