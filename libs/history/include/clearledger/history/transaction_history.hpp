#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>

#include "clearledger/common/types.hpp"

namespace clearledger {
namespace history {

// Accepted deposits and withdrawals, keyed by transaction id. These are the
// only transactions a dispute, resolve or chargeback can reference.
class TransactionHistory {
 public:
  void record(const common::TransactionRecord& tx);
  [[nodiscard]] const common::TransactionRecord* lookup(common::TxId tx) const;
  std::optional<common::TransactionRecord> remove(common::TxId tx);

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

 private:
  std::unordered_map<common::TxId, common::TransactionRecord> entries_{};
};

}  // namespace history
}  // namespace clearledger
