#include "swapvault/vault/deposit_orchestrator.hpp"

#include <mutex>
#include <type_traits>

#include "swapvault/amm/swap_math.hpp"

namespace swapvault {
namespace vault {

namespace {

DepositResult rejected(common::Status status, const DepositRequest& request,
                       common::Amount estimate = 0) {
  return DepositResult{
      .status = status,
      .reject_code = common::reject_code(status),
      .receipt = {.user = request.user,
                  .asset_in = request.asset_in,
                  .amount_in = request.amount_in,
                  .reference_credited = 0},
      .estimate = estimate,
      .credit = {},
      .uncredited = {.asset = request.asset_in, .amount = request.amount_in},
  };
}

// Where the input ended up after the adapter turned the swap down.
Holding left_after(const pool::SwapOutcome& outcome, const DepositRequest& request,
                   common::AssetId reference_asset) {
  if (outcome.amount_out > 0) {
    return {.asset = reference_asset, .amount = outcome.amount_out};
  }
  if (outcome.status == common::Status::kZeroEffectiveInput || outcome.amount_in_effective > 0) {
    return {.asset = request.asset_in, .amount = outcome.amount_in_returned};
  }
  return {.asset = request.asset_in, .amount = request.amount_in};
}

QuoteResult quote_rejected(common::Status status) {
  return QuoteResult{
      .status = status,
      .reject_code = common::reject_code(status),
      .reference_out = 0,
      .cap_units = 0,
      .direct = false,
  };
}

}  // namespace

DepositRoute DepositOrchestrator::route(common::AssetId asset_in) const noexcept {
  if (asset_in == reference_asset_) {
    return DirectCredit{};
  }
  return SwapThenCredit{.asset_in = asset_in};
}

DepositResult DepositOrchestrator::execute(const DepositRequest& request) {
  std::scoped_lock lock(custody_.mutex);

  if (custody_.swap_in_progress) {
    return rejected(common::Status::kReentrantCall, request);
  }
  if (access_.is_paused()) {
    return rejected(common::Status::kSystemPaused, request);
  }
  if (request.user == common::kZeroAccount || request.amount_in == 0) {
    return rejected(common::Status::kInvalidInput, request);
  }

  return std::visit(
      [&](const auto& path) -> DepositResult {
        using Path = std::decay_t<decltype(path)>;
        if constexpr (std::is_same_v<Path, DirectCredit>) {
          return credit(request, request.amount_in, request.amount_in);
        } else {
          return swap_then_credit(request);
        }
      },
      route(request.asset_in));
}

DepositResult DepositOrchestrator::swap_then_credit(const DepositRequest& request) {
  const pool::ReservesResult reserves = adapter_.get_reserves(request.asset_in, reference_asset_);
  if (reserves.status != common::Status::kOk) {
    return rejected(reserves.status, request);
  }

  const amm::SwapQuote estimate = amm::expected_out(request.amount_in,
                                                    reserves.reserves.reserve_in,
                                                    reserves.reserves.reserve_out);
  if (estimate.status != common::Status::kOk) {
    return rejected(estimate.status, request);
  }
  // Fail before any funds leave custody.
  if (estimate.amount_out < request.min_reference_out || estimate.amount_out == 0) {
    return rejected(common::Status::kInsufficientOutputAmount, request, estimate.amount_out);
  }

  pool::SwapOutcome outcome;
  {
    SwapInProgress guard(custody_);
    outcome = adapter_.swap(pool::SwapRequest{
        .asset_in = request.asset_in,
        .asset_out = reference_asset_,
        .amount_in = request.amount_in,
        .amount_out_expected = estimate.amount_out,
        .min_amount_out = request.min_reference_out,
        .recipient = custody_account_,
    });
  }
  custody_.reference_in += outcome.amount_out;
  if (outcome.status != common::Status::kOk) {
    DepositResult result = rejected(outcome.status, request, estimate.amount_out);
    result.uncredited = left_after(outcome, request, reference_asset_);
    return result;
  }

  return credit(request, outcome.amount_out, estimate.amount_out);
}

DepositResult DepositOrchestrator::credit(const DepositRequest& request,
                                          common::Amount reference_amount,
                                          common::Amount estimate) {
  const ledger::CreditResult committed = ledger_.credit(request.user, reference_amount);
  DepositResult result = rejected(committed.status, request, estimate);
  result.credit = committed;
  if (committed.status != common::Status::kOk) {
    result.uncredited = {.asset = reference_asset_, .amount = reference_amount};
    return result;
  }
  result.uncredited = {.asset = reference_asset_, .amount = 0};
  result.receipt.reference_credited = reference_amount;
  return result;
}

QuoteResult DepositOrchestrator::quote(common::AssetId asset_in, common::Amount amount_in) const {
  if (amount_in == 0) {
    return quote_rejected(common::Status::kInvalidInput);
  }

  QuoteResult result{};
  if (std::holds_alternative<DirectCredit>(route(asset_in))) {
    result.direct = true;
    result.reference_out = amount_in;
  } else {
    const pool::ReservesResult reserves = adapter_.get_reserves(asset_in, reference_asset_);
    if (reserves.status != common::Status::kOk) {
      return quote_rejected(reserves.status);
    }
    const amm::SwapQuote estimate = amm::expected_out(amount_in,
                                                      reserves.reserves.reserve_in,
                                                      reserves.reserves.reserve_out);
    if (estimate.status != common::Status::kOk) {
      return quote_rejected(estimate.status);
    }
    result.reference_out = estimate.amount_out;
  }

  const auto cap_units = ledger_.converter().to_cap_units(result.reference_out);
  if (!cap_units) {
    return quote_rejected(common::Status::kArithmeticOverflow);
  }
  result.cap_units = *cap_units;
  return result;
}

}  // namespace vault
}  // namespace swapvault
