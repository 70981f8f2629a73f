#pragma once

#include <cstdint>

#include "swapvault/assets/token_book.hpp"
#include "swapvault/common/status.hpp"
#include "swapvault/common/types.hpp"
#include "swapvault/pool/pair.hpp"

namespace swapvault {
namespace pool {

struct PoolReserves {
  common::Amount reserve_in{0};
  common::Amount reserve_out{0};
  bool token_in_is_first{false};
};

struct ReservesResult {
  common::Status status{common::Status::kOk};
  PoolReserves reserves{};
};

struct SwapRequest {
  common::AssetId asset_in{0};
  common::AssetId asset_out{0};
  common::Amount amount_in{0};             // nominal amount sent from custody
  common::Amount amount_out_expected{0};   // upper bound on the output requested from the pair
  common::Amount min_amount_out{0};        // lower bound on what the recipient must receive
  common::AccountId recipient{common::kZeroAccount};
};

struct SwapOutcome {
  common::Status status{common::Status::kOk};
  std::uint16_t reject_code{0};
  common::Amount amount_in_effective{0};
  // Output that reached the recipient. Non-zero on a rejection only when the
  // trade ran and what arrived fell short of the minimum.
  common::Amount amount_out{0};
  // Input handed back to custody after the pair refused to trade it.
  common::Amount amount_in_returned{0};
};

// Protocol translation between the vault and a PairRegistry. Every amount it
// reports is a measured balance delta, never the nominal figure it asked for.
class PoolAdapter {
 public:
  PoolAdapter(PairRegistry& registry, assets::AssetTransfer& assets, common::AccountId custody_account)
      : registry_(registry), assets_(assets), custody_account_(custody_account) {}

  [[nodiscard]] ReservesResult get_reserves(common::AssetId asset_in, common::AssetId asset_out) const;
  SwapOutcome swap(const SwapRequest& request);

 private:
  PairRegistry& registry_;
  assets::AssetTransfer& assets_;
  common::AccountId custody_account_;

  static ReservesResult orient(const Pair& pair, common::AssetId asset_in);
  SwapOutcome return_input(Pair& pair, common::AssetId asset_in, SwapOutcome outcome);
};

}  // namespace pool
}  // namespace swapvault
