#include "swapvault/ledger/unit_converter.hpp"

#include <stdexcept>

#include "swapvault/common/checked_math.hpp"

namespace swapvault {
namespace ledger {

UnitConverter UnitConverter::from_decimals(std::uint8_t native_decimals, std::uint8_t cap_decimals) {
  if (cap_decimals < native_decimals) {
    throw std::invalid_argument("cap decimals below reference decimals");
  }
  common::Amount scale = 1;
  for (std::uint8_t i = native_decimals; i < cap_decimals; ++i) {
    const auto next = common::checked_mul<common::Amount>(scale, 10);
    if (!next) {
      throw std::invalid_argument("cap scale overflows");
    }
    scale = *next;
  }
  return UnitConverter{scale};
}

std::optional<common::Amount> UnitConverter::to_cap_units(common::Amount amount_native) const noexcept {
  return common::checked_mul(amount_native, scale_);
}

}  // namespace ledger
}  // namespace swapvault
