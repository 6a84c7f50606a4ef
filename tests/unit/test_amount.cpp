#include "test_amount.hpp"

#include <cassert>
#include <cstdint>
#include <limits>

#include "clearledger/common/amount.hpp"

namespace clearledger::tests {

using common::Amount;

void test_amount_parse_rounding() {
  assert(Amount::parse("1.0000001")->units() == 10'000);
  assert(Amount::parse("2.0")->units() == 20'000);
  assert(Amount::parse("0.5")->units() == 5'000);
  assert(Amount::parse("7")->units() == 70'000);
  assert(Amount::parse(".25")->units() == 2'500);
  assert(Amount::parse("3.")->units() == 30'000);
  assert(Amount::parse("+1.5")->units() == 15'000);

  // Half away from zero at the fifth fractional digit.
  assert(Amount::parse("1.00005")->units() == 10'001);
  assert(Amount::parse("1.000049999")->units() == 10'000);
  assert(Amount::parse("0.99995")->units() == 10'000);
  assert(Amount::parse("-1.00005")->units() == -10'001);
  assert(Amount::parse("-0.00004")->units() == 0);
}

void test_amount_parse_rejects_garbage() {
  assert(!Amount::parse(""));
  assert(!Amount::parse("."));
  assert(!Amount::parse("-"));
  assert(!Amount::parse("abc"));
  assert(!Amount::parse("1.2.3"));
  assert(!Amount::parse("1,5"));
  assert(!Amount::parse("1e3"));
  assert(!Amount::parse("1.5E-2"));
  assert(!Amount::parse("inf"));
  assert(!Amount::parse("nan"));
  assert(!Amount::parse(" 1.0"));
  assert(!Amount::parse("1.00x"));
  assert(!Amount::parse("99999999999999999999"));

  assert(Amount::parse("922337203685477.5807"));
  assert(!Amount::parse("922337203685477.5808"));
}

void test_amount_to_string() {
  assert(Amount{}.to_string() == "0.0000");
  assert(Amount::from_units(10'000).to_string() == "1.0000");
  assert(Amount::from_units(5).to_string() == "0.0005");
  assert(Amount::from_units(-5'000).to_string() == "-0.5000");
  assert(Amount::from_whole(12).to_string() == "12.0000");
  assert(Amount::parse("1.23456")->to_string() == "1.2346");

  const auto a = Amount::from_units(15'000);
  const auto b = Amount::from_units(5'000);
  assert((a - b).units() == 10'000);
  assert((a + b).units() == 20'000);
  assert(b < a);
}

void test_amount_checked_arithmetic() {
  const auto max = Amount::from_units(std::numeric_limits<std::int64_t>::max());
  const auto min = Amount::from_units(std::numeric_limits<std::int64_t>::min());
  const auto one = Amount::from_units(1);

  assert(Amount::checked_add(one, one) == Amount::from_units(2));
  assert(Amount::checked_add(max, Amount{}) == max);
  assert(!Amount::checked_add(max, one));
  assert(!Amount::checked_add(min, Amount::from_units(-1)));
  assert(Amount::checked_add(max, min) == Amount::from_units(-1));

  assert(Amount::checked_sub(one, one) == Amount{});
  assert(!Amount::checked_sub(min, one));
  assert(!Amount::checked_sub(max, Amount::from_units(-1)));
  assert(Amount::checked_sub(Amount{}, max) == Amount::from_units(-std::numeric_limits<std::int64_t>::max()));
}

}  // namespace clearledger::tests
