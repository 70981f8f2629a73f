#pragma once

#include <cstdint>

namespace swapvault {
namespace common {

using AccountId = std::uint64_t;
using AssetId = std::uint32_t;
using Amount = std::uint64_t;

inline constexpr AccountId kZeroAccount = 0;

// Native currency is tracked by the token book under a reserved asset id.
inline constexpr AssetId kNativeAsset = 0;

}  // namespace common
}  // namespace swapvault
