#pragma once

namespace swapvault::tests {

void test_token_book_fees();
void test_native_wrapper_round_trip();

}  // namespace swapvault::tests
