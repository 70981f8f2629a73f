#pragma once

namespace swapvault::tests {

void test_telemetry_sink();
void test_telemetry_buffer_bounded();
void test_vault_telemetry_counters();

}  // namespace swapvault::tests
