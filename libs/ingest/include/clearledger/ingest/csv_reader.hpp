#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "clearledger/ingest/record_source.hpp"

namespace clearledger {
namespace ingest {

// Reads `type,client,tx,amount` rows from a delimited text stream.
class CsvReader : public RecordSource {
 public:
  struct Options {
    char delimiter{','};
    bool has_headers{true};
    bool trim{true};
    bool flexible{true};  // rows may omit trailing fields
  };

  explicit CsvReader(std::istream& in);
  CsvReader(std::istream& in, Options options);

  bool next(common::TransactionRecord& out_record) override;

  [[nodiscard]] std::uint64_t line_number() const noexcept { return line_number_; }

 private:
  enum Column : std::size_t {
    kType,
    kClient,
    kTx,
    kAmount,
    kColumnCount,
  };

  static constexpr std::size_t kMissingColumn = static_cast<std::size_t>(-1);

  std::istream& in_;
  Options options_;
  std::uint64_t line_number_{0};
  bool header_consumed_{false};
  std::size_t row_width_{0};
  std::array<std::size_t, kColumnCount> columns_{kType, kClient, kTx, kAmount};
  std::vector<std::string> fields_{};

  bool read_row();
  bool consume_header();
  [[nodiscard]] std::string_view field(Column column) const;
  [[noreturn]] void fail_malformed(const std::string& message) const;
};

}  // namespace ingest
}  // namespace clearledger
