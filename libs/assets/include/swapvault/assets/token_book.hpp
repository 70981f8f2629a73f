#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "swapvault/common/types.hpp"

namespace swapvault {
namespace assets {

class TransferError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Asset-transfer collaborator. Implementations may deliver less than the
// nominal amount and may not report success at all; callers that care measure
// balance deltas through balance_of.
class AssetTransfer {
 public:
  virtual ~AssetTransfer() = default;

  [[nodiscard]] virtual common::Amount balance_of(common::AssetId asset,
                                                  common::AccountId holder) const = 0;

  // Throws TransferError when the sender cannot cover the amount.
  virtual void transfer(common::AssetId asset, common::AccountId from,
                        common::AccountId to, common::Amount amount) = 0;
};

struct AssetInfo {
  std::string symbol;
  std::uint8_t decimals{18};
  std::uint32_t transfer_fee_basis_points{0};  // withheld from the recipient and burned
};

// In-memory multi-asset balance book.
class TokenBook : public AssetTransfer {
 public:
  void register_asset(common::AssetId asset, AssetInfo info);
  [[nodiscard]] bool has_asset(common::AssetId asset) const;
  [[nodiscard]] AssetInfo info(common::AssetId asset) const;

  void mint(common::AssetId asset, common::AccountId to, common::Amount amount);
  void burn(common::AssetId asset, common::AccountId from, common::Amount amount);

  [[nodiscard]] common::Amount balance_of(common::AssetId asset,
                                          common::AccountId holder) const override;
  void transfer(common::AssetId asset, common::AccountId from,
                common::AccountId to, common::Amount amount) override;

  [[nodiscard]] common::Amount total_supply(common::AssetId asset) const;

 private:
  struct AssetState {
    AssetInfo info{};
    common::Amount supply{0};
    std::unordered_map<common::AccountId, common::Amount> balances{};
  };

  mutable std::mutex mutex_;
  std::unordered_map<common::AssetId, AssetState> assets_{};

  AssetState& require_asset(common::AssetId asset);
  const AssetState& require_asset(common::AssetId asset) const;
};

}  // namespace assets
}  // namespace swapvault
