#pragma once

#include <ostream>
#include <span>
#include <vector>

#include "clearledger/common/amount.hpp"
#include "clearledger/common/types.hpp"
#include "clearledger/ledger/ledger_state.hpp"

namespace clearledger {
namespace snapshot {

struct AccountSnapshot {
  common::ClientId client{};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};
};

// One entry per account, in ledger iteration order.
[[nodiscard]] std::vector<AccountSnapshot> snapshot(const ledger::LedgerState& ledger);

class CsvWriter {
 public:
  struct Options {
    char delimiter{','};
    bool sort_by_client{false};
  };

  explicit CsvWriter(std::ostream& out);
  CsvWriter(std::ostream& out, Options options);

  // Writes the header followed by one row per account and flushes. Throws
  // std::runtime_error if the stream fails.
  void write(std::span<const AccountSnapshot> accounts);

 private:
  std::ostream& out_;
  Options options_;
};

}  // namespace snapshot
}  // namespace clearledger
