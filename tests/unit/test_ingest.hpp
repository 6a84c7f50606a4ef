#pragma once

namespace clearledger::tests {

void test_csv_reader_trims_and_maps_header();
void test_csv_reader_without_headers();
void test_csv_reader_rejects_malformed_rows();
void test_csv_reader_unknown_type();
void test_csv_reader_strict_width();

}  // namespace clearledger::tests
