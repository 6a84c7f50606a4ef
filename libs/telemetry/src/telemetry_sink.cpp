#include "clearledger/telemetry/telemetry_sink.hpp"

namespace clearledger {
namespace telemetry {

std::string_view metric_name(std::uint64_t id) noexcept {
  switch (id) {
    case kRecordsRead:
      return "records_read";
    case kRecordsApplied:
      return "records_applied";
    case kAccountsCreated:
      return "accounts_created";
    case kRejectedAccountLocked:
      return "rejected_account_locked";
    case kRejectedInsufficientFunds:
      return "rejected_insufficient_funds";
    case kRejectedInsufficientHeld:
      return "rejected_insufficient_held";
    case kRejectedUnknownTransaction:
      return "rejected_unknown_transaction";
    case kRejectedNotDeposit:
      return "rejected_not_deposit";
    case kRejectedOverflow:
      return "rejected_overflow";
    case kFatalErrors:
      return "fatal_errors";
    default:
      return "unknown";
  }
}

void TelemetrySink::push(Sample sample) {
  counters_[sample.id] += sample.value;
}

void TelemetrySink::increment(std::uint64_t id, std::int64_t delta) {
  push(Sample{.id = id, .value = delta});
}

std::int64_t TelemetrySink::total(std::uint64_t id) const {
  if (auto it = counters_.find(id); it != counters_.end()) {
    return it->second;
  }
  return 0;
}

std::vector<Sample> TelemetrySink::drain() {
  std::vector<Sample> samples;
  samples.reserve(counters_.size());
  for (const auto& [id, value] : counters_) {
    samples.push_back(Sample{.id = id, .value = value});
  }
  counters_.clear();
  return samples;
}

}  // namespace telemetry
}  // namespace clearledger
