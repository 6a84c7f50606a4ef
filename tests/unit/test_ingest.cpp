#include "test_ingest.hpp"

#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "clearledger/common/errors.hpp"
#include "clearledger/ingest/csv_reader.hpp"

namespace clearledger::tests {

namespace {

std::vector<common::TransactionRecord> read_all(const std::string& text, ingest::CsvReader::Options options = {}) {
  std::istringstream in(text);
  ingest::CsvReader reader(in, options);
  std::vector<common::TransactionRecord> records;
  common::TransactionRecord record;
  while (reader.next(record)) {
    records.push_back(record);
  }
  return records;
}

common::ErrorKind read_error(const std::string& text, ingest::CsvReader::Options options = {}) {
  try {
    read_all(text, options);
  } catch (const common::ProcessingError& e) {
    return e.kind();
  }
  assert(false && "expected a ProcessingError");
  return common::ErrorKind::kSourceFailure;
}

}  // namespace

void test_csv_reader_trims_and_maps_header() {
  const auto records = read_all(
      "type, client, tx, amount\n"
      "deposit, 1, 1, 1.0000001\n"
      "\n"
      "  withdrawal ,2,  6 , 3.0\r\n"
      "dispute, 1, 1\n"
      "resolve, 1, 1,\n"
      "chargeback,65535,4294967295\n");

  assert(records.size() == 5);
  assert(records[0].kind == common::TransactionKind::kDeposit);
  assert(records[0].client == 1);
  assert(records[0].tx == 1);
  assert(records[0].amount == common::Amount::from_units(10'000));

  assert(records[1].kind == common::TransactionKind::kWithdrawal);
  assert(records[1].client == 2);
  assert(records[1].tx == 6);
  assert(records[1].amount == common::Amount::from_units(30'000));

  assert(records[2].kind == common::TransactionKind::kDispute);
  assert(!records[2].amount.has_value());
  assert(!records[3].amount.has_value());

  assert(records[4].client == 65'535);
  assert(records[4].tx == 4'294'967'295u);

  // Columns are found by name, in any order.
  const auto reordered = read_all("amount;tx;type;client\n\"2.5\";7;deposit;3\n", {.delimiter = ';'});
  assert(reordered.size() == 1);
  assert(reordered[0].client == 3);
  assert(reordered[0].tx == 7);
  assert(reordered[0].amount == common::Amount::from_units(25'000));

  assert(read_all("").empty());
  assert(read_all("type,client,tx,amount\n").empty());
}

void test_csv_reader_without_headers() {
  const auto records = read_all("deposit,4,10,0.1\ndispute,4,10\n", {.has_headers = false});
  assert(records.size() == 2);
  assert(records[0].client == 4);
  assert(records[0].amount == common::Amount::from_units(1'000));
  assert(records[1].kind == common::TransactionKind::kDispute);
}

void test_csv_reader_rejects_malformed_rows() {
  const std::string header = "type,client,tx,amount\n";
  assert(read_error(header + "deposit,70000,1,1.0\n") == common::ErrorKind::kMalformedRecord);
  assert(read_error(header + "deposit,-1,1,1.0\n") == common::ErrorKind::kMalformedRecord);
  assert(read_error(header + "deposit,1,x,1.0\n") == common::ErrorKind::kMalformedRecord);
  assert(read_error(header + "deposit,1,1,abc\n") == common::ErrorKind::kMalformedRecord);
  assert(read_error(header + "deposit,1,1,-2.0\n") == common::ErrorKind::kMalformedRecord);
  assert(read_error(header + "deposit,1\n") == common::ErrorKind::kMalformedRecord);
  assert(read_error(header + "deposit,\"1,1,1.0\n") == common::ErrorKind::kMalformedRecord);
  assert(read_error("kind,client,tx,amount\ndeposit,1,1,1.0\n") == common::ErrorKind::kMalformedRecord);

  // Without trimming, padded numbers are not numbers.
  assert(read_error(header + "deposit, 1,1,1.0\n", {.trim = false}) == common::ErrorKind::kMalformedRecord);

  std::istringstream in(header + "deposit,1,1,1.0\ndeposit,1,x,1.0\n");
  ingest::CsvReader reader(in);
  common::TransactionRecord record;
  assert(reader.next(record));
  assert(reader.line_number() == 2);
  try {
    reader.next(record);
    assert(false && "expected a ProcessingError");
  } catch (const common::ProcessingError& e) {
    assert(std::string(e.what()).find("line 3") != std::string::npos);
  }
}

void test_csv_reader_unknown_type() {
  assert(read_error("type,client,tx,amount\ntransfer,1,1,1.0\n") == common::ErrorKind::kUnknownTransactionKind);
  assert(read_error("type,client,tx,amount\nDeposit,1,1,1.0\n") == common::ErrorKind::kUnknownTransactionKind);
}

void test_csv_reader_strict_width() {
  const std::string text = "type,client,tx,amount\ndeposit,1,1,1.0\ndispute,1,1\n";
  assert(read_all(text).size() == 2);
  assert(read_error(text, {.flexible = false}) == common::ErrorKind::kMalformedRecord);
  assert(read_all("type,client,tx,amount\ndispute,1,1,\n", {.flexible = false}).size() == 1);
}

}  // namespace clearledger::tests
