#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include "swapvault/auth/access_control.hpp"
#include "swapvault/common/status.hpp"
#include "swapvault/common/types.hpp"

namespace swapvault {
namespace vault {

struct DepositReceipt {
  common::AccountId user{common::kZeroAccount};
  common::AssetId asset_in{0};
  common::Amount amount_in{0};
  common::Amount reference_credited{0};
};

struct DepositCompleted {
  DepositReceipt receipt{};
};

// Funds reached custody but no claim was recorded for them.
struct DepositFailed {
  common::AccountId user{common::kZeroAccount};
  common::AssetId asset_stranded{0};
  common::Amount amount_stranded{0};
  common::Status status{common::Status::kOk};
};

struct WithdrawalCompleted {
  common::AccountId user{common::kZeroAccount};
  common::Amount amount{0};
  common::Amount balance_after{0};
};

struct CapUpdated {
  common::Amount before{0};
  common::Amount after{0};
};

struct RescueCompleted {
  common::AssetId asset{0};
  common::AccountId to{common::kZeroAccount};
  common::Amount amount{0};
};

struct PauseChanged {
  bool paused{false};
};

// A signed command passed authorization; its nonce is spent.
struct AdminAccepted {
  common::AccountId caller{common::kZeroAccount};
  std::uint64_t nonce{0};
  auth::AdminAction action{auth::AdminAction::kPause};
};

using Event = std::variant<DepositCompleted, DepositFailed, WithdrawalCompleted,
                           CapUpdated, RescueCompleted, PauseChanged, AdminAccepted>;

// Journal kind is the variant index plus one.
[[nodiscard]] std::uint16_t event_kind(const Event& event) noexcept;
[[nodiscard]] std::vector<std::byte> encode_event(const Event& event);
[[nodiscard]] std::optional<Event> decode_event(std::uint16_t kind, std::span<const std::byte> payload);

}  // namespace vault
}  // namespace swapvault
