#pragma once

#include <cstdint>
#include <functional>

#include "clearledger/common/types.hpp"
#include "clearledger/history/transaction_history.hpp"
#include "clearledger/ingest/record_source.hpp"
#include "clearledger/ledger/ledger_state.hpp"
#include "clearledger/processor/transaction_processor.hpp"
#include "clearledger/telemetry/telemetry_sink.hpp"

namespace clearledger {
namespace replay {

// Folds the transaction processor over a record source in input order.
// The first common::ProcessingError (from the source or the processor) stops
// the run and propagates; records applied before it remain in the ledger.
class Driver {
 public:
  using WarningHandler = std::function<void(const common::TransactionRecord&, const processor::Outcome&)>;

  Driver();

  void set_warning_handler(WarningHandler handler);
  void set_telemetry(telemetry::TelemetrySink* sink) noexcept { telemetry_ = sink; }

  [[nodiscard]] ledger::LedgerState execute(ingest::RecordSource& source);
  void execute(ingest::RecordSource& source, ledger::LedgerState& ledger, history::TransactionHistory& history);

 private:
  WarningHandler warning_handler_{};
  telemetry::TelemetrySink* telemetry_{nullptr};

  void count(std::uint64_t metric, std::int64_t delta = 1);
  void apply_one(ledger::LedgerState& ledger,
                 history::TransactionHistory& history,
                 const common::TransactionRecord& record);
};

// Runs a fresh ledger over the whole source with no warning handler.
[[nodiscard]] ledger::LedgerState process(ingest::RecordSource& source);

}  // namespace replay
}  // namespace clearledger
