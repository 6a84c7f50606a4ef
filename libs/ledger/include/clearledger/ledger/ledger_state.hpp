#pragma once

#include <cstddef>
#include <unordered_map>

#include "clearledger/common/amount.hpp"
#include "clearledger/common/types.hpp"

namespace clearledger {
namespace ledger {

struct Account {
  common::Amount available{};
  common::Amount held{};
  bool locked{false};

  [[nodiscard]] common::Amount total() const noexcept { return available + held; }
};

// Per-client account store. Iteration order is whatever the map holds.
class LedgerState {
 public:
  using AccountMap = std::unordered_map<common::ClientId, Account>;
  using const_iterator = AccountMap::const_iterator;

  Account& get_or_create(common::ClientId client);
  [[nodiscard]] const Account* find(common::ClientId client) const;

  [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }
  [[nodiscard]] bool empty() const noexcept { return accounts_.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return accounts_.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return accounts_.end(); }

 private:
  AccountMap accounts_{};
};

}  // namespace ledger
}  // namespace clearledger
