#pragma once

#include <cstdint>
#include <optional>

#include "swapvault/common/types.hpp"

namespace swapvault {
namespace ledger {

// Rescales reference-asset amounts into cap units by an exact power of ten.
class UnitConverter {
 public:
  static constexpr common::Amount kDefaultScale = 100;  // 6 -> 8 fractional digits

  constexpr UnitConverter() noexcept = default;
  explicit constexpr UnitConverter(common::Amount scale) noexcept : scale_(scale) {}

  // Throws std::invalid_argument when cap precision is below native precision
  // or the ratio does not fit.
  static UnitConverter from_decimals(std::uint8_t native_decimals, std::uint8_t cap_decimals);

  // std::nullopt on overflow.
  [[nodiscard]] std::optional<common::Amount> to_cap_units(common::Amount amount_native) const noexcept;
  [[nodiscard]] constexpr common::Amount scale() const noexcept { return scale_; }

 private:
  common::Amount scale_{kDefaultScale};
};

}  // namespace ledger
}  // namespace swapvault
