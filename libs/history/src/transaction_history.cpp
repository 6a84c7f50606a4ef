#include "clearledger/history/transaction_history.hpp"

#include <utility>

namespace clearledger {
namespace history {

void TransactionHistory::record(const common::TransactionRecord& tx) {
  entries_.insert_or_assign(tx.tx, tx);
}

const common::TransactionRecord* TransactionHistory::lookup(common::TxId tx) const {
  if (auto it = entries_.find(tx); it != entries_.end()) {
    return &it->second;
  }
  return nullptr;
}

std::optional<common::TransactionRecord> TransactionHistory::remove(common::TxId tx) {
  auto it = entries_.find(tx);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  common::TransactionRecord entry = std::move(it->second);
  entries_.erase(it);
  return entry;
}

}  // namespace history
}  // namespace clearledger
