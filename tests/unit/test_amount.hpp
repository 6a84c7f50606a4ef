#pragma once

namespace clearledger::tests {

void test_amount_parse_rounding();
void test_amount_parse_rejects_garbage();
void test_amount_to_string();
void test_amount_checked_arithmetic();

}  // namespace clearledger::tests
