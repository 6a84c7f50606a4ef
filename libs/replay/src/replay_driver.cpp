#include "clearledger/replay/replay_driver.hpp"

#include <utility>

#include "clearledger/common/errors.hpp"

namespace clearledger {
namespace replay {

namespace {

std::uint64_t rejection_metric(processor::Decision decision) noexcept {
  switch (decision) {
    case processor::Decision::kRejectedAccountLocked:
      return telemetry::kRejectedAccountLocked;
    case processor::Decision::kRejectedInsufficientFunds:
      return telemetry::kRejectedInsufficientFunds;
    case processor::Decision::kRejectedInsufficientHeld:
      return telemetry::kRejectedInsufficientHeld;
    case processor::Decision::kRejectedUnknownTransaction:
      return telemetry::kRejectedUnknownTransaction;
    case processor::Decision::kRejectedNotDeposit:
      return telemetry::kRejectedNotDeposit;
    case processor::Decision::kRejectedOverflow:
      return telemetry::kRejectedOverflow;
    case processor::Decision::kApplied:
      break;
  }
  return telemetry::kRecordsApplied;
}

}  // namespace

Driver::Driver() = default;

void Driver::set_warning_handler(WarningHandler handler) {
  warning_handler_ = std::move(handler);
}

ledger::LedgerState Driver::execute(ingest::RecordSource& source) {
  ledger::LedgerState ledger;
  history::TransactionHistory history;
  execute(source, ledger, history);
  return ledger;
}

void Driver::execute(ingest::RecordSource& source,
                     ledger::LedgerState& ledger,
                     history::TransactionHistory& history) {
  try {
    common::TransactionRecord record;
    while (source.next(record)) {
      count(telemetry::kRecordsRead);
      apply_one(ledger, history, record);
    }
  } catch (const common::ProcessingError&) {
    count(telemetry::kFatalErrors);
    throw;
  }
}

void Driver::apply_one(ledger::LedgerState& ledger,
                       history::TransactionHistory& history,
                       const common::TransactionRecord& record) {
  const auto accounts_before = ledger.size();
  const auto outcome = processor::apply(ledger, history, record);

  if (ledger.size() != accounts_before) {
    count(telemetry::kAccountsCreated);
  }
  count(rejection_metric(outcome.decision));

  if (!outcome.applied() && warning_handler_) {
    warning_handler_(record, outcome);
  }
}

void Driver::count(std::uint64_t metric, std::int64_t delta) {
  if (telemetry_) {
    telemetry_->increment(metric, delta);
  }
}

ledger::LedgerState process(ingest::RecordSource& source) {
  Driver driver;
  return driver.execute(source);
}

}  // namespace replay
}  // namespace clearledger
