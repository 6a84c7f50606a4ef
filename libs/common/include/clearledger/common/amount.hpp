#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace clearledger {
namespace common {

// Fixed-point monetary value with four fractional digits, stored as a count
// of 1/10'000 units. Values parsed from text are rounded half away from zero.
class Amount {
 public:
  static constexpr std::int64_t kScale = 10'000;
  static constexpr int kFractionDigits = 4;

  constexpr Amount() noexcept = default;

  static constexpr Amount from_units(std::int64_t units) noexcept { return Amount{units}; }
  static constexpr Amount from_whole(std::int64_t whole) noexcept { return Amount{whole * kScale}; }

  // Accepts [+|-]digits[.digits]; at least one digit is required. Returns
  // nullopt for anything else or when the value does not fit.
  static std::optional<Amount> parse(std::string_view text) noexcept;

  [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return units_ < 0; }

  // Always renders exactly four fractional digits, e.g. "-1.5000".
  [[nodiscard]] std::string to_string() const;

  // nullopt when the result does not fit in the scaled 64-bit range.
  [[nodiscard]] static constexpr std::optional<Amount> checked_add(Amount lhs, Amount rhs) noexcept {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if ((rhs.units_ > 0 && lhs.units_ > kMax - rhs.units_) || (rhs.units_ < 0 && lhs.units_ < kMin - rhs.units_)) {
      return std::nullopt;
    }
    return Amount{lhs.units_ + rhs.units_};
  }

  [[nodiscard]] static constexpr std::optional<Amount> checked_sub(Amount lhs, Amount rhs) noexcept {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if ((rhs.units_ < 0 && lhs.units_ > kMax + rhs.units_) || (rhs.units_ > 0 && lhs.units_ < kMin + rhs.units_)) {
      return std::nullopt;
    }
    return Amount{lhs.units_ - rhs.units_};
  }

  constexpr Amount& operator+=(Amount other) noexcept {
    units_ += other.units_;
    return *this;
  }

  constexpr Amount& operator-=(Amount other) noexcept {
    units_ -= other.units_;
    return *this;
  }

  friend constexpr Amount operator+(Amount lhs, Amount rhs) noexcept { return lhs += rhs; }
  friend constexpr Amount operator-(Amount lhs, Amount rhs) noexcept { return lhs -= rhs; }
  friend constexpr bool operator==(Amount, Amount) noexcept = default;
  friend constexpr auto operator<=>(Amount, Amount) noexcept = default;

 private:
  explicit constexpr Amount(std::int64_t units) noexcept : units_(units) {}

  std::int64_t units_{0};
};

}  // namespace common
}  // namespace clearledger
