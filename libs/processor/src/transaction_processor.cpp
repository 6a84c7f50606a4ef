#include "clearledger/processor/transaction_processor.hpp"

#include <utility>

#include "clearledger/common/errors.hpp"

namespace clearledger {
namespace processor {

namespace {

Outcome rejected(Decision decision, std::string message) {
  return Outcome{.decision = decision, .message = std::move(message)};
}

common::Amount require_amount(const common::TransactionRecord& record) {
  if (!record.amount) {
    throw common::ProcessingError(common::ErrorKind::kMissingAmount,
                                  std::string(common::to_string(record.kind)) + " entry without the amount (tx " +
                                      std::to_string(record.tx) + ")");
  }
  return *record.amount;
}

Outcome overflow(const common::TransactionRecord& record) {
  return rejected(Decision::kRejectedOverflow,
                  "Ignoring " + std::string(common::to_string(record.kind)) + " that would overflow client account " +
                      std::to_string(record.client) + " (tx " + std::to_string(record.tx) + ")");
}

Outcome deposit(ledger::Account& account,
                history::TransactionHistory& history,
                const common::TransactionRecord& record) {
  const auto amount = require_amount(record);
  if (account.locked) {
    return rejected(Decision::kRejectedAccountLocked,
                    "Cannot deposit - client account " + std::to_string(record.client) + " is locked");
  }
  // Checking the total as well keeps available + held representable.
  const auto available = common::Amount::checked_add(account.available, amount);
  if (!available || !common::Amount::checked_add(account.total(), amount)) {
    return overflow(record);
  }
  account.available = *available;
  history.record(record);
  return {};
}

Outcome withdraw(ledger::Account& account,
                 history::TransactionHistory& history,
                 const common::TransactionRecord& record) {
  const auto amount = require_amount(record);
  if (account.locked) {
    return rejected(Decision::kRejectedAccountLocked,
                    "Cannot withdraw - client account " + std::to_string(record.client) + " is locked");
  }
  if (account.available < amount) {
    return rejected(Decision::kRejectedInsufficientFunds,
                    "Insufficient balance for withdrawal from client account " + std::to_string(record.client));
  }
  account.available -= amount;
  history.record(record);
  return {};
}

Outcome dispute(ledger::Account& account,
                const history::TransactionHistory& history,
                const common::TransactionRecord& record) {
  const auto* disputed = history.lookup(record.tx);
  if (!disputed) {
    return rejected(Decision::kRejectedUnknownTransaction,
                    "Ignoring dispute that references unknown transaction " + std::to_string(record.tx));
  }
  const auto amount = disputed->amount.value_or(common::Amount{});
  if (account.available < amount) {
    return rejected(Decision::kRejectedInsufficientFunds,
                    "Cannot dispute more than what is available (tx " + std::to_string(record.tx) + ")");
  }
  const auto held = common::Amount::checked_add(account.held, amount);
  if (!held) {
    return overflow(record);
  }
  account.available -= amount;
  account.held = *held;
  return {};
}

Outcome resolve(ledger::Account& account,
                const history::TransactionHistory& history,
                const common::TransactionRecord& record) {
  const auto* disputed = history.lookup(record.tx);
  if (!disputed) {
    return rejected(Decision::kRejectedUnknownTransaction,
                    "Ignoring resolve that references unknown transaction " + std::to_string(record.tx));
  }
  const auto amount = disputed->amount.value_or(common::Amount{});
  if (account.held < amount) {
    return rejected(Decision::kRejectedInsufficientHeld,
                    "Cannot resolve more than what is held (tx " + std::to_string(record.tx) + ")");
  }
  const auto available = common::Amount::checked_add(account.available, amount);
  if (!available) {
    return overflow(record);
  }
  account.held -= amount;
  account.available = *available;
  return {};
}

Outcome chargeback(ledger::Account& account,
                   history::TransactionHistory& history,
                   const common::TransactionRecord& record) {
  // Taking the entry out of history is what makes a second chargeback a no-op.
  auto disputed = history.remove(record.tx);
  if (!disputed) {
    return rejected(Decision::kRejectedUnknownTransaction,
                    "Ignoring chargeback that references unknown transaction " + std::to_string(record.tx));
  }
  if (disputed->kind != common::TransactionKind::kDeposit) {
    history.record(*disputed);
    return rejected(Decision::kRejectedNotDeposit,
                    "Ignoring chargeback acting on a different transaction than deposit (tx " +
                        std::to_string(record.tx) + ")");
  }
  const auto held = common::Amount::checked_sub(account.held, disputed->amount.value_or(common::Amount{}));
  if (!held) {
    history.record(*disputed);
    return overflow(record);
  }
  account.locked = true;
  account.held = *held;
  return {};
}

}  // namespace

std::string_view to_string(Decision decision) noexcept {
  switch (decision) {
    case Decision::kApplied:
      return "applied";
    case Decision::kRejectedAccountLocked:
      return "rejected_account_locked";
    case Decision::kRejectedInsufficientFunds:
      return "rejected_insufficient_funds";
    case Decision::kRejectedInsufficientHeld:
      return "rejected_insufficient_held";
    case Decision::kRejectedUnknownTransaction:
      return "rejected_unknown_transaction";
    case Decision::kRejectedNotDeposit:
      return "rejected_not_deposit";
    case Decision::kRejectedOverflow:
      return "rejected_overflow";
  }
  return "unknown";
}

Outcome apply(ledger::LedgerState& ledger,
              history::TransactionHistory& history,
              const common::TransactionRecord& record) {
  auto& account = ledger.get_or_create(record.client);

  switch (record.kind) {
    case common::TransactionKind::kDeposit:
      return deposit(account, history, record);
    case common::TransactionKind::kWithdrawal:
      return withdraw(account, history, record);
    case common::TransactionKind::kDispute:
      return dispute(account, history, record);
    case common::TransactionKind::kResolve:
      return resolve(account, history, record);
    case common::TransactionKind::kChargeback:
      return chargeback(account, history, record);
  }

  throw common::ProcessingError(
      common::ErrorKind::kUnknownTransactionKind,
      "Unknown transaction type " + std::to_string(static_cast<unsigned>(record.kind)) + " (tx " +
          std::to_string(record.tx) + ")");
}

}  // namespace processor
}  // namespace clearledger
