#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "clearledger/common/amount.hpp"

namespace clearledger {
namespace common {

using ClientId = std::uint16_t;
using TxId = std::uint32_t;

enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

// Input unit. Only deposits and withdrawals carry an amount.
struct TransactionRecord {
  TransactionKind kind{TransactionKind::kDeposit};
  ClientId client{};
  TxId tx{};
  std::optional<Amount> amount{};
};

inline constexpr std::string_view to_string(TransactionKind kind) noexcept {
  switch (kind) {
    case TransactionKind::kDeposit:
      return "deposit";
    case TransactionKind::kWithdrawal:
      return "withdrawal";
    case TransactionKind::kDispute:
      return "dispute";
    case TransactionKind::kResolve:
      return "resolve";
    case TransactionKind::kChargeback:
      return "chargeback";
  }
  return "unknown";
}

inline constexpr std::optional<TransactionKind> parse_transaction_kind(std::string_view text) noexcept {
  if (text == "deposit") {
    return TransactionKind::kDeposit;
  }
  if (text == "withdrawal") {
    return TransactionKind::kWithdrawal;
  }
  if (text == "dispute") {
    return TransactionKind::kDispute;
  }
  if (text == "resolve") {
    return TransactionKind::kResolve;
  }
  if (text == "chargeback") {
    return TransactionKind::kChargeback;
  }
  return std::nullopt;
}

}  // namespace common
}  // namespace clearledger
