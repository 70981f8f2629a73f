#include "test_swap_math.hpp"

#include <cassert>
#include <limits>

#include "swapvault/amm/swap_math.hpp"

namespace swapvault::tests {

void test_expected_out_formula() {
  // floor(1000 * 997 * 100000 / (50000 * 1000 + 1000 * 997))
  const auto quote = amm::expected_out(1'000, 50'000, 100'000);
  assert(quote.status == common::Status::kOk);
  assert(quote.amount_out == 1'955);

  // Same inputs, same answer.
  assert(amm::expected_out(1'000, 50'000, 100'000).amount_out == quote.amount_out);

  // Output never reaches the reserve, however large the input.
  const auto drained = amm::expected_out(std::numeric_limits<common::Amount>::max() / 1'000, 10, 10);
  assert(drained.status == common::Status::kOk);
  assert(drained.amount_out == 9);

  // Dust rounds down to nothing.
  assert(amm::expected_out(1, 1'000'000, 1'000).amount_out == 0);
}

void test_expected_out_rejections() {
  assert(amm::expected_out(0, 50'000, 100'000).status == common::Status::kZeroAmount);
  assert(amm::expected_out(1'000, 0, 100'000).status == common::Status::kInsufficientLiquidity);
  assert(amm::expected_out(1'000, 50'000, 0).status == common::Status::kInsufficientLiquidity);

  constexpr auto kMax = std::numeric_limits<common::Amount>::max();
  const auto overflow = amm::expected_out(kMax, kMax, kMax);
  assert(overflow.status == common::Status::kArithmeticOverflow);
  assert(overflow.amount_out == 0);
}

}  // namespace swapvault::tests
