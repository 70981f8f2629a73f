#pragma once

#include <limits>
#include <optional>
#include <type_traits>

namespace swapvault {
namespace common {

// Unsigned only: callers report std::nullopt as ArithmeticOverflow.
using Wide = unsigned __int128;

template <typename T>
[[nodiscard]] constexpr std::optional<T> checked_add(T lhs, T rhs) noexcept {
  static_assert(std::is_unsigned_v<T> || std::is_same_v<T, Wide>);
  T out{};
  if (__builtin_add_overflow(lhs, rhs, &out)) {
    return std::nullopt;
  }
  return out;
}

template <typename T>
[[nodiscard]] constexpr std::optional<T> checked_mul(T lhs, T rhs) noexcept {
  static_assert(std::is_unsigned_v<T> || std::is_same_v<T, Wide>);
  T out{};
  if (__builtin_mul_overflow(lhs, rhs, &out)) {
    return std::nullopt;
  }
  return out;
}

template <typename Narrow>
[[nodiscard]] constexpr std::optional<Narrow> narrow(Wide value) noexcept {
  if (value > static_cast<Wide>(std::numeric_limits<Narrow>::max())) {
    return std::nullopt;
  }
  return static_cast<Narrow>(value);
}

}  // namespace common
}  // namespace swapvault
