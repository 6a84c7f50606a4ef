#pragma once

#include <cstdint>
#include <map>
#include <string_view>
#include <vector>

namespace clearledger {
namespace telemetry {

enum MetricId : std::uint64_t {
  kRecordsRead = 1,
  kRecordsApplied = 2,
  kAccountsCreated = 3,
  kRejectedAccountLocked = 10,
  kRejectedInsufficientFunds = 11,
  kRejectedInsufficientHeld = 12,
  kRejectedUnknownTransaction = 13,
  kRejectedNotDeposit = 14,
  kRejectedOverflow = 15,
  kFatalErrors = 20,
};

std::string_view metric_name(std::uint64_t id) noexcept;

struct Sample {
  std::uint64_t id{};
  std::int64_t value{};
};

// Run counters. Pushed samples are folded into one counter per metric id,
// so memory is bounded by the number of distinct ids.
class TelemetrySink {
 public:
  void push(Sample sample);
  void increment(std::uint64_t id, std::int64_t delta = 1);
  [[nodiscard]] std::int64_t total(std::uint64_t id) const;

  // One sample per metric id, ordered by id. Resets the counters.
  [[nodiscard]] std::vector<Sample> drain();

 private:
  std::map<std::uint64_t, std::int64_t> counters_{};
};

}  // namespace telemetry
}  // namespace clearledger
