#pragma once

#include <cstdint>

#include "swapvault/common/status.hpp"
#include "swapvault/common/types.hpp"

namespace swapvault {
namespace amm {

inline constexpr std::uint64_t kFeeNumerator = 997;
inline constexpr std::uint64_t kFeeDenominator = 1000;

struct SwapQuote {
  common::Status status{common::Status::kOk};
  common::Amount amount_out{0};
};

// Constant-product output with the 0.3% fee taken from the input:
//   floor(amount_in * 997 * reserve_out / (reserve_in * 1000 + amount_in * 997))
// Every intermediate is 128-bit and overflow-checked.
[[nodiscard]] SwapQuote expected_out(common::Amount amount_in,
                                     common::Amount reserve_in,
                                     common::Amount reserve_out) noexcept;

}  // namespace amm
}  // namespace swapvault
