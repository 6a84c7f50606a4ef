#include "clearledger/ingest/csv_reader.hpp"

#include <charconv>
#include <initializer_list>
#include <optional>
#include <utility>

#include "clearledger/common/errors.hpp"

namespace clearledger {
namespace ingest {

namespace {

constexpr std::array<std::string_view, 4> kColumnNames{"type", "client", "tx", "amount"};

std::string_view trim_view(std::string_view text) noexcept {
  constexpr std::string_view kWhitespace = " \t\r\n\v\f";
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

// Splits one line, honouring double-quoted fields with "" as an escaped quote.
// Returns false when a quote is left open.
bool split_fields(std::string_view line, char delimiter, std::vector<std::string>& out) {
  out.clear();
  std::string current;
  bool quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          quoted = false;
        }
      } else {
        current.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == delimiter) {
      out.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  out.push_back(std::move(current));
  return !quoted;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) noexcept {
  T value{};
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

CsvReader::CsvReader(std::istream& in)
    : CsvReader(in, Options{}) {}

CsvReader::CsvReader(std::istream& in, Options options)
    : in_(in), options_(options) {}

bool CsvReader::next(common::TransactionRecord& out_record) {
  if (options_.has_headers && !header_consumed_) {
    header_consumed_ = true;
    if (!consume_header()) {
      return false;
    }
  }

  if (!read_row()) {
    return false;
  }

  if (row_width_ == 0) {
    row_width_ = fields_.size();
  }
  if (!options_.flexible && fields_.size() != row_width_) {
    fail_malformed("expected " + std::to_string(row_width_) + " fields, found " + std::to_string(fields_.size()));
  }

  const auto type_text = field(kType);
  const auto kind = common::parse_transaction_kind(type_text);
  if (!kind) {
    throw common::ProcessingError(common::ErrorKind::kUnknownTransactionKind,
                                  "Unknown transaction type \"" + std::string(type_text) + "\" on line " +
                                      std::to_string(line_number_));
  }

  const auto client = parse_unsigned<common::ClientId>(field(kClient));
  if (!client) {
    fail_malformed("invalid client id \"" + std::string(field(kClient)) + "\"");
  }

  const auto tx = parse_unsigned<common::TxId>(field(kTx));
  if (!tx) {
    fail_malformed("invalid transaction id \"" + std::string(field(kTx)) + "\"");
  }

  std::optional<common::Amount> amount;
  if (const auto amount_text = field(kAmount); !amount_text.empty()) {
    amount = common::Amount::parse(amount_text);
    if (!amount) {
      fail_malformed("invalid amount \"" + std::string(amount_text) + "\"");
    }
    if (amount->is_negative()) {
      fail_malformed("negative amount \"" + std::string(amount_text) + "\"");
    }
  }

  out_record = common::TransactionRecord{
      .kind = *kind,
      .client = *client,
      .tx = *tx,
      .amount = amount,
  };
  return true;
}

bool CsvReader::read_row() {
  std::string line;
  while (std::getline(in_, line)) {
    ++line_number_;
    if (trim_view(line).empty()) {
      continue;
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!split_fields(line, options_.delimiter, fields_)) {
      fail_malformed("unterminated quoted field");
    }
    if (options_.trim) {
      for (auto& f : fields_) {
        f = std::string(trim_view(f));
      }
    }
    return true;
  }

  if (in_.bad()) {
    throw common::ProcessingError(common::ErrorKind::kSourceFailure,
                                  "failed to read input after line " + std::to_string(line_number_));
  }
  return false;
}

bool CsvReader::consume_header() {
  if (!read_row()) {
    return false;
  }

  columns_.fill(kMissingColumn);
  for (std::size_t idx = 0; idx < fields_.size(); ++idx) {
    for (std::size_t column = 0; column < kColumnNames.size(); ++column) {
      if (fields_[idx] == kColumnNames[column] && columns_[column] == kMissingColumn) {
        columns_[column] = idx;
      }
    }
  }

  for (const auto column : {kType, kClient, kTx}) {
    if (columns_[column] == kMissingColumn) {
      fail_malformed("header is missing the \"" + std::string(kColumnNames[column]) + "\" column");
    }
  }

  row_width_ = fields_.size();
  return true;
}

std::string_view CsvReader::field(Column column) const {
  const auto idx = columns_[column];
  if (idx == kMissingColumn || idx >= fields_.size()) {
    return {};
  }
  return fields_[idx];
}

void CsvReader::fail_malformed(const std::string& message) const {
  throw common::ProcessingError(common::ErrorKind::kMalformedRecord,
                                "line " + std::to_string(line_number_) + ": " + message);
}

}  // namespace ingest
}  // namespace clearledger
