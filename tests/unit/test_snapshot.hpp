#pragma once

namespace clearledger::tests {

void test_snapshot_accounts();
void test_csv_writer_output();

}  // namespace clearledger::tests
