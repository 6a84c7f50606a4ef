#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "clearledger/common/types.hpp"
#include "clearledger/history/transaction_history.hpp"
#include "clearledger/ledger/ledger_state.hpp"

namespace clearledger {
namespace processor {

enum class Decision : std::uint8_t {
  kApplied,
  kRejectedAccountLocked,
  kRejectedInsufficientFunds,
  kRejectedInsufficientHeld,
  kRejectedUnknownTransaction,
  kRejectedNotDeposit,
  kRejectedOverflow,
};

std::string_view to_string(Decision decision) noexcept;

struct Outcome {
  Decision decision{Decision::kApplied};
  std::string message{};

  [[nodiscard]] bool applied() const noexcept { return decision == Decision::kApplied; }
};

// Applies one record to the ledger and history. Business-rule rejections come
// back as an Outcome and leave both untouched; a record that cannot be
// interpreted at all (missing amount, unknown kind) throws
// common::ProcessingError.
Outcome apply(ledger::LedgerState& ledger,
              history::TransactionHistory& history,
              const common::TransactionRecord& record);

}  // namespace processor
}  // namespace clearledger
