#include "swapvault/pool/pool_adapter.hpp"

#include <algorithm>
#include <cstdio>

#include "swapvault/amm/swap_math.hpp"

namespace swapvault {
namespace pool {

namespace {

SwapOutcome reject(common::Status status, common::Amount effective_in = 0) {
  return SwapOutcome{
      .status = status,
      .reject_code = common::reject_code(status),
      .amount_in_effective = effective_in,
      .amount_out = 0,
      .amount_in_returned = 0,
  };
}

}  // namespace

ReservesResult PoolAdapter::get_reserves(common::AssetId asset_in, common::AssetId asset_out) const {
  const Pair* pair = registry_.find(asset_in, asset_out);
  if (!pair) {
    return {.status = common::Status::kPairNotFound, .reserves = {}};
  }
  return orient(*pair, asset_in);
}

SwapOutcome PoolAdapter::swap(const SwapRequest& request) {
  using common::Status;

  if (request.amount_in == 0 || request.recipient == common::kZeroAccount) {
    return reject(Status::kInvalidInput);
  }

  Pair* pair = registry_.find(request.asset_in, request.asset_out);
  if (!pair) {
    return reject(Status::kPairNotFound);
  }

  // Nothing moves toward an empty pair.
  const ReservesResult oriented = orient(*pair, request.asset_in);
  if (oriented.status != Status::kOk) {
    return reject(oriented.status);
  }
  const PoolReserves reserves = oriented.reserves;

  // Deliver first, then trust only what the pair actually holds.
  const common::Amount pair_before = assets_.balance_of(request.asset_in, pair->account());
  try {
    assets_.transfer(request.asset_in, custody_account_, pair->account(), request.amount_in);
  } catch (const assets::TransferError&) {
    return reject(Status::kTransferFailed);
  }
  const common::Amount pair_after = assets_.balance_of(request.asset_in, pair->account());
  const common::Amount effective_in = pair_after > pair_before ? pair_after - pair_before : 0;
  if (effective_in == 0) {
    return reject(Status::kZeroEffectiveInput);
  }

  const amm::SwapQuote quote = amm::expected_out(effective_in, reserves.reserve_in, reserves.reserve_out);
  if (quote.status != Status::kOk) {
    return return_input(*pair, request.asset_in, reject(quote.status, effective_in));
  }
  const common::Amount requested = std::min(quote.amount_out, request.amount_out_expected);
  // Priced on what arrived: a shortfall here means no trade at all.
  if (requested == 0 || requested < request.min_amount_out) {
    return return_input(*pair, request.asset_in, reject(Status::kInsufficientOutputAmount, effective_in));
  }

  const common::Amount recipient_before = assets_.balance_of(request.asset_out, request.recipient);
  try {
    if (reserves.token_in_is_first) {
      pair->swap(0, requested, request.recipient);
    } else {
      pair->swap(requested, 0, request.recipient);
    }
  } catch (const PoolError&) {
    return return_input(*pair, request.asset_in, reject(Status::kSwapFailed, effective_in));
  } catch (const assets::TransferError&) {
    return reject(Status::kTransferFailed, effective_in);
  }
  const common::Amount recipient_after = assets_.balance_of(request.asset_out, request.recipient);
  const common::Amount received = recipient_after > recipient_before ? recipient_after - recipient_before : 0;

  // Independent of the estimate: what arrived must still clear the minimum.
  if (received < request.min_amount_out || received == 0) {
    SwapOutcome short_out = reject(Status::kInsufficientOutputAmount, effective_in);
    short_out.amount_out = received;
    return short_out;
  }

  return SwapOutcome{
      .status = Status::kOk,
      .reject_code = 0,
      .amount_in_effective = effective_in,
      .amount_out = received,
      .amount_in_returned = 0,
  };
}

SwapOutcome PoolAdapter::return_input(Pair& pair, common::AssetId asset_in, SwapOutcome outcome) {
  const common::Amount custody_before = assets_.balance_of(asset_in, custody_account_);
  try {
    pair.skim(custody_account_);
  } catch (const PoolError& e) {
    // The input stays with the pair; amount_in_returned remains zero.
    std::fprintf(stderr, "pool %llu: input not returned: %s\n",
                 static_cast<unsigned long long>(pair.account()), e.what());
    return outcome;
  } catch (const assets::TransferError& e) {
    std::fprintf(stderr, "pool %llu: input not returned: %s\n",
                 static_cast<unsigned long long>(pair.account()), e.what());
    return outcome;
  }
  const common::Amount custody_after = assets_.balance_of(asset_in, custody_account_);
  outcome.amount_in_returned = custody_after > custody_before ? custody_after - custody_before : 0;
  return outcome;
}

ReservesResult PoolAdapter::orient(const Pair& pair, common::AssetId asset_in) {
  const Reserves raw = pair.reserves();
  const bool in_is_first = pair.token0() == asset_in;
  ReservesResult result{
      .status = common::Status::kOk,
      .reserves = {
          .reserve_in = in_is_first ? raw.reserve0 : raw.reserve1,
          .reserve_out = in_is_first ? raw.reserve1 : raw.reserve0,
          .token_in_is_first = in_is_first,
      },
  };
  if (result.reserves.reserve_in == 0 || result.reserves.reserve_out == 0) {
    result.status = common::Status::kInsufficientLiquidity;
  }
  return result;
}

}  // namespace pool
}  // namespace swapvault
