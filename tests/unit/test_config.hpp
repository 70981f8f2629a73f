#pragma once

namespace swapvault::tests {

void test_config_default_round_trip();
void test_config_validation();

}  // namespace swapvault::tests
