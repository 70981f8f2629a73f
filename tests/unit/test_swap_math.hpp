#pragma once

namespace swapvault::tests {

void test_expected_out_formula();
void test_expected_out_rejections();

}  // namespace swapvault::tests
