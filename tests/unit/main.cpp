// Unit test runner - calls test functions from per-component test files

#include "test_admin.hpp"
#include "test_assets.hpp"
#include "test_config.hpp"
#include "test_deposit.hpp"
#include "test_journal.hpp"
#include "test_ledger.hpp"
#include "test_pool.hpp"
#include "test_swap_math.hpp"
#include "test_telemetry.hpp"
#include "test_withdrawal.hpp"

int main() {
  using namespace swapvault::tests;

  // Swap math tests
  test_expected_out_formula();
  test_expected_out_rejections();

  // Ledger tests
  test_ledger_credit_debit();
  test_ledger_solvency_random_walk();
  test_ledger_cap_enforcement();
  test_unit_converter();

  // Asset tests
  test_token_book_fees();
  test_native_wrapper_round_trip();

  // Pool tests
  test_pool_fee_on_transfer_input();
  test_pool_missing_and_empty_pairs();
  test_pool_short_output_rejected();
  test_pool_shortfall_rejected_before_trading();
  test_pair_invariant();

  // Deposit tests
  test_deposit_swap_path();
  test_deposit_direct_path();
  test_deposit_fee_on_transfer_asset();
  test_deposit_shortfall_leaves_pool_untouched();
  test_deposit_failure_leaves_ledger_unchanged();
  test_deposit_rejects_reentry_during_swap();
  test_deposit_native();
  test_deposit_input_checks();

  // Withdrawal tests
  test_withdrawal_pays_out();
  test_withdrawal_reentry_cannot_double_spend();
  test_withdrawal_nested_payout_not_counted();
  test_withdrawal_nested_deposit_not_refunded();
  test_withdrawal_transfer_failure_rolls_back();

  // Admin tests
  test_admin_bank_cap();
  test_admin_authorization();
  test_admin_rescue();

  // Journal tests
  test_journal_replay_rebuilds_ledger();
  test_journal_detects_corruption();
  test_journal_torn_tail_repaired();
  test_event_codec();

  // Config tests
  test_config_default_round_trip();
  test_config_validation();

  // Telemetry tests
  test_telemetry_sink();
  test_telemetry_buffer_bounded();
  test_vault_telemetry_counters();

  return 0;
}
