#pragma once

namespace swapvault::tests {

void test_journal_replay_rebuilds_ledger();
void test_journal_detects_corruption();
void test_journal_torn_tail_repaired();
void test_event_codec();

}  // namespace swapvault::tests
