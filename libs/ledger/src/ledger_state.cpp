#include "clearledger/ledger/ledger_state.hpp"

namespace clearledger {
namespace ledger {

Account& LedgerState::get_or_create(common::ClientId client) {
  return accounts_.try_emplace(client).first->second;
}

const Account* LedgerState::find(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

}  // namespace ledger
}  // namespace clearledger
