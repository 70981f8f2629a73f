#include "swapvault/common/status.hpp"

namespace swapvault {
namespace common {

namespace {
constexpr std::uint16_t kRejectCodeBase = 3000;
}  // namespace

std::uint16_t reject_code(Status status) noexcept {
  if (status == Status::kOk) {
    return 0;
  }
  return static_cast<std::uint16_t>(kRejectCodeBase + static_cast<std::uint16_t>(status));
}

std::string_view to_string(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return "Ok";
    case Status::kInvalidInput:
      return "InvalidInput";
    case Status::kZeroAmount:
      return "ZeroAmount";
    case Status::kPairNotFound:
      return "PairNotFound";
    case Status::kInsufficientLiquidity:
      return "InsufficientLiquidity";
    case Status::kZeroEffectiveInput:
      return "ZeroEffectiveInput";
    case Status::kInsufficientOutputAmount:
      return "InsufficientOutputAmount";
    case Status::kCapExceeded:
      return "CapExceeded";
    case Status::kInsufficientBalance:
      return "InsufficientBalance";
    case Status::kArithmeticOverflow:
      return "ArithmeticOverflow";
    case Status::kSystemPaused:
      return "SystemPaused";
    case Status::kUnauthorized:
      return "Unauthorized";
    case Status::kTransferFailed:
      return "TransferFailed";
    case Status::kSwapFailed:
      return "SwapFailed";
    case Status::kReentrantCall:
      return "ReentrantCall";
    case Status::kWrapFailed:
      return "WrapFailed";
  }
  return "Unknown";
}

}  // namespace common
}  // namespace swapvault
