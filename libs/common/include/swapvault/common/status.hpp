#pragma once

#include <cstdint>
#include <string_view>

namespace swapvault {
namespace common {

enum class Status : std::uint8_t {
  kOk,
  kInvalidInput,
  kZeroAmount,
  kPairNotFound,
  kInsufficientLiquidity,
  kZeroEffectiveInput,
  kInsufficientOutputAmount,
  kCapExceeded,
  kInsufficientBalance,
  kArithmeticOverflow,
  kSystemPaused,
  kUnauthorized,
  kTransferFailed,
  kSwapFailed,
  kReentrantCall,
  kWrapFailed,
};

// Numeric code reported alongside a rejection; 0 for kOk.
[[nodiscard]] std::uint16_t reject_code(Status status) noexcept;
[[nodiscard]] std::string_view to_string(Status status) noexcept;

inline constexpr bool ok(Status status) noexcept { return status == Status::kOk; }

}  // namespace common
}  // namespace swapvault
