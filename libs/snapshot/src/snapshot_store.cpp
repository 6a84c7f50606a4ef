#include "clearledger/snapshot/snapshot_store.hpp"

#include <algorithm>
#include <stdexcept>

namespace clearledger {
namespace snapshot {

std::vector<AccountSnapshot> snapshot(const ledger::LedgerState& ledger) {
  std::vector<AccountSnapshot> accounts;
  accounts.reserve(ledger.size());
  for (const auto& [client, account] : ledger) {
    accounts.push_back(AccountSnapshot{
        .client = client,
        .available = account.available,
        .held = account.held,
        .total = account.total(),
        .locked = account.locked,
    });
  }
  return accounts;
}

CsvWriter::CsvWriter(std::ostream& out)
    : CsvWriter(out, Options{}) {}

CsvWriter::CsvWriter(std::ostream& out, Options options)
    : out_(out), options_(options) {}

void CsvWriter::write(std::span<const AccountSnapshot> accounts) {
  std::vector<AccountSnapshot> rows(accounts.begin(), accounts.end());
  if (options_.sort_by_client) {
    std::sort(rows.begin(), rows.end(), [](const AccountSnapshot& lhs, const AccountSnapshot& rhs) {
      return lhs.client < rhs.client;
    });
  }

  const char d = options_.delimiter;
  out_ << "client" << d << "available" << d << "held" << d << "total" << d << "locked\n";
  for (const auto& row : rows) {
    out_ << row.client << d
         << row.available.to_string() << d
         << row.held.to_string() << d
         << row.total.to_string() << d
         << (row.locked ? "true" : "false") << '\n';
  }
  out_.flush();

  if (!out_) {
    throw std::runtime_error("failed to write account snapshot");
  }
}

}  // namespace snapshot
}  // namespace clearledger
