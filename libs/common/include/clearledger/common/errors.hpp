#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace clearledger {
namespace common {

// Conditions that abort a run. Per-record rejections are not errors and are
// reported through processor::Outcome instead.
enum class ErrorKind : std::uint8_t {
  kMissingAmount,
  kUnknownTransactionKind,
  kMalformedRecord,
  kSourceFailure,
};

inline constexpr std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kMissingAmount:
      return "missing amount";
    case ErrorKind::kUnknownTransactionKind:
      return "unknown transaction kind";
    case ErrorKind::kMalformedRecord:
      return "malformed record";
    case ErrorKind::kSourceFailure:
      return "source failure";
  }
  return "unknown error";
}

class ProcessingError : public std::runtime_error {
 public:
  ProcessingError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace common
}  // namespace clearledger
