#include "swapvault/amm/swap_math.hpp"

#include "swapvault/common/checked_math.hpp"

namespace swapvault {
namespace amm {

SwapQuote expected_out(common::Amount amount_in,
                       common::Amount reserve_in,
                       common::Amount reserve_out) noexcept {
  using common::Status;
  using common::Wide;

  if (amount_in == 0) {
    return {.status = Status::kZeroAmount, .amount_out = 0};
  }
  if (reserve_in == 0 || reserve_out == 0) {
    return {.status = Status::kInsufficientLiquidity, .amount_out = 0};
  }

  const auto in_with_fee = common::checked_mul<Wide>(amount_in, kFeeNumerator);
  if (!in_with_fee) {
    return {.status = Status::kArithmeticOverflow, .amount_out = 0};
  }
  const auto numerator = common::checked_mul<Wide>(*in_with_fee, reserve_out);
  const auto scaled_reserve = common::checked_mul<Wide>(reserve_in, kFeeDenominator);
  if (!numerator || !scaled_reserve) {
    return {.status = Status::kArithmeticOverflow, .amount_out = 0};
  }
  const auto denominator = common::checked_add<Wide>(*scaled_reserve, *in_with_fee);
  if (!denominator) {
    return {.status = Status::kArithmeticOverflow, .amount_out = 0};
  }

  // Quotient is strictly below reserve_out, so it always fits.
  const auto out = common::narrow<common::Amount>(*numerator / *denominator);
  if (!out) {
    return {.status = Status::kArithmeticOverflow, .amount_out = 0};
  }
  return {.status = Status::kOk, .amount_out = *out};
}

}  // namespace amm
}  // namespace swapvault
