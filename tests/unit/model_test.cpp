#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/model/decimal.hpp"
#include "internal/model/temporal.hpp"
#include "internal/model/uuid.hpp"

namespace {

using namespace std::chrono;
using ducksql::model::Decimal;
using ducksql::model::Interval;
using ducksql::model::TimeTz;
using ducksql::model::Uuid;

template <typename E, typename F>
bool Throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestDecimalParseKeepsScale() {
  const auto d = Decimal::Parse("-123.4500");
  assert(d.Scale() == 4);
  assert(d.Precision() == 7);
  assert(d.ToString() == "-123.4500");

  assert(Decimal::Parse(".5").ToString() == "0.5");
  assert(Decimal::Parse("42").Scale() == 0);
}

void TestDecimalEqualityIgnoresTrailingZeros() {
  assert(Decimal::Parse("1.50") == Decimal::Parse("1.5"));
  assert(!(Decimal::Parse("1.51") == Decimal::Parse("1.5")));
  assert(Decimal(std::int64_t{7}) == Decimal::Parse("7.000"));
}

void TestDecimalRescale() {
  assert(Decimal::Parse("1.5").Rescale(3).ToString() == "1.500");
  assert(Decimal::Parse("2.500").Rescale(1).ToString() == "2.5");
  assert(Throws<std::overflow_error>([] { (void)Decimal::Parse("1.25").Rescale(1); }));
}

void TestDecimalPrecisionLimit() {
  const std::string max_digits(38, '9');
  assert(Decimal::Parse(max_digits).Precision() == 38);
  assert(Decimal::Parse("-" + max_digits).ToString() == "-" + max_digits);

  assert(Throws<std::overflow_error>([] { (void)Decimal::Parse(std::string(39, '9')); }));
  assert(Throws<std::invalid_argument>([] { (void)Decimal::Parse("12a"); }));
  assert(Throws<std::invalid_argument>([] { (void)Decimal::Parse("1.2.3"); }));
  assert(Throws<std::invalid_argument>([] { (void)Decimal::Parse(""); }));
}

void TestUuidParseAndFormat() {
  const std::string canonical = "00112233-4455-6677-8899-aabbccddeeff";
  const auto        id        = Uuid::Parse(canonical);
  assert(id.bytes[0] == 0x00);
  assert(id.bytes[15] == 0xff);
  assert(id.ToString() == canonical);

  assert(Uuid::Parse("{00112233-4455-6677-8899-AABBCCDDEEFF}") == id);
  assert(Uuid::Parse("00112233445566778899aabbccddeeff") == id);

  assert(Throws<std::invalid_argument>([] { (void)Uuid::Parse("00112233-4455-6677-8899-aabbccddeefg"); }));
  assert(Throws<std::invalid_argument>([] { (void)Uuid::Parse("00112233"); }));
}

void TestUuidGenerateIsVersion4() {
  const auto a = Uuid::Generate();
  const auto b = Uuid::Generate();
  assert(!(a == b));
  assert((a.bytes[6] >> 4) == 4);
  assert((a.bytes[8] & 0xC0) == 0x80);
}

void TestTimeTzParse() {
  const auto t = TimeTz::Parse("12:34:56.123456+05:30");
  assert(t.time == hours{12} + minutes{34} + seconds{56} + microseconds{123456});
  assert(t.offset == hours{5} + minutes{30});
  assert(t.UtcTime() == hours{7} + minutes{4} + seconds{56} + microseconds{123456});
  assert(ducksql::model::ToString(t) == "12:34:56.123456+05:30");

  const auto west = TimeTz::Parse("01:00:00-02");
  assert(west.offset == -hours{2});
  assert(west.UtcTime() == hours{3});

  assert(Throws<std::invalid_argument>([] { (void)TimeTz::Parse("12:34"); }));
}

void TestTimeTzUtcWrapsAroundMidnight() {
  const TimeTz early{hours{1}, hours{2}};
  assert(early.UtcTime() == hours{23});

  const TimeTz late{hours{23}, -hours{3}};
  assert(late.UtcTime() == hours{2});

  // same instant, different offsets
  const TimeTz a{hours{12}, hours{0}};
  const TimeTz b{hours{14}, hours{2}};
  assert(!(a == b));
  assert(a.UtcTime() == b.UtcTime());
}

void TestIntervalSplitsDays() {
  const auto i = Interval::FromDuration(hours{51} + microseconds{7});
  assert(i.months == 0);
  assert(i.days == 2);
  assert(i.micros == (hours{3} + microseconds{7}).count());
  assert(i.ToDuration() == hours{51} + microseconds{7});

  const Interval month{1, 0, 0};
  assert(month.ToDuration() == hours{24 * 30});
}

void TestTimestampHelpers() {
  using ducksql::model::Timestamp;

  const Timestamp before_epoch = local_days{1969y / December / 31} + hours{23};
  assert(ducksql::model::FloorToDate(before_epoch) == sys_days{1969y / December / 31});

  const Timestamp noon = local_days{2024y / March / 1} + hours{12};
  assert(ducksql::model::AssumeUtc(noon) == sys_days{2024y / March / 1} + hours{12});

  const ducksql::model::DateTimeOffset offset{noon, hours{2}};
  assert(offset.UtcTime() == sys_days{2024y / March / 1} + hours{10});
}

} // namespace

int main() {
  TestDecimalParseKeepsScale();
  TestDecimalEqualityIgnoresTrailingZeros();
  TestDecimalRescale();
  TestDecimalPrecisionLimit();
  TestUuidParseAndFormat();
  TestUuidGenerateIsVersion4();
  TestTimeTzParse();
  TestTimeTzUtcWrapsAroundMidnight();
  TestIntervalSplitsDays();
  TestTimestampHelpers();

  std::cout << "ducksql_unit_model: pass\n";
  return 0;
}
