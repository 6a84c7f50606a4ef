#include "clearledger/common/amount.hpp"

#include <limits>

namespace clearledger {
namespace common {

namespace {
constexpr std::uint64_t kMaxUnits = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
constexpr std::uint64_t kMaxWhole = kMaxUnits / static_cast<std::uint64_t>(Amount::kScale);

constexpr bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}
}  // namespace

std::optional<Amount> Amount::parse(std::string_view text) noexcept {
  bool negative = false;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const auto dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  const std::string_view fraction = (dot == std::string_view::npos) ? std::string_view{} : text.substr(dot + 1);
  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }

  std::uint64_t whole_value = 0;
  for (const char c : whole) {
    if (!is_digit(c)) {
      return std::nullopt;
    }
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (whole_value > (kMaxWhole - digit) / 10) {
      return std::nullopt;
    }
    whole_value = whole_value * 10 + digit;
  }

  std::uint64_t fraction_units = 0;
  bool round_up = false;
  for (std::size_t i = 0; i < fraction.size(); ++i) {
    const char c = fraction[i];
    if (!is_digit(c)) {
      return std::nullopt;
    }
    if (i < static_cast<std::size_t>(kFractionDigits)) {
      fraction_units = fraction_units * 10 + static_cast<std::uint64_t>(c - '0');
    } else if (i == static_cast<std::size_t>(kFractionDigits)) {
      round_up = c >= '5';
    }
  }
  for (std::size_t i = fraction.size(); i < static_cast<std::size_t>(kFractionDigits); ++i) {
    fraction_units *= 10;
  }

  std::uint64_t units = whole_value * static_cast<std::uint64_t>(kScale) + fraction_units;
  if (round_up) {
    ++units;
  }
  if (units > kMaxUnits) {
    return std::nullopt;
  }

  const auto signed_units = static_cast<std::int64_t>(units);
  return Amount{negative ? -signed_units : signed_units};
}

std::string Amount::to_string() const {
  const bool negative = units_ < 0;
  const std::uint64_t magnitude = negative ? (~static_cast<std::uint64_t>(units_) + 1)
                                           : static_cast<std::uint64_t>(units_);

  std::string fraction = std::to_string(magnitude % static_cast<std::uint64_t>(kScale));
  fraction.insert(0, static_cast<std::size_t>(kFractionDigits) - fraction.size(), '0');

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(magnitude / static_cast<std::uint64_t>(kScale));
  out.push_back('.');
  out += fraction;
  return out;
}

}  // namespace common
}  // namespace clearledger
