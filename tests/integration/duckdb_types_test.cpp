#include <cassert>
#include <chrono>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/executor.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace {

using namespace std::chrono;
namespace sql   = ducksql::sql;
namespace model = ducksql::model;
namespace util  = ducksql::util;

// Binds `value` as $v and reads the single result column with `read`.
template <typename F>
auto Echo(const std::string& select, const sql::SqlValue& value, F read) {
  return sql::ExecuteRow(sql::InMemory("types", false).Query(select).Parameters({{"v", value}}), read);
}

template <typename F>
auto Echo(const sql::SqlValue& value, F read) {
  return Echo("SELECT $v AS v", value, read);
}

void TestIntegerBounds() {
  using L32 = std::numeric_limits<std::int32_t>;
  using L64 = std::numeric_limits<std::int64_t>;

  assert(Echo(sql::Integer(L32::min()), [](sql::RowReader& r) { return r.Int("v"); }) == L32::min());
  assert(Echo(sql::Integer(L32::max()), [](sql::RowReader& r) { return r.Int("v"); }) == L32::max());
  assert(Echo(sql::BigInt(L64::min()), [](sql::RowReader& r) { return r.Int64("v"); }) == L64::min());
  assert(Echo(sql::BigInt(L64::max()), [](sql::RowReader& r) { return r.Int64("v"); }) == L64::max());
  assert(Echo(sql::TinyInt(-128), [](sql::RowReader& r) { return r.Int8("v"); }) == -128);
  assert(Echo(sql::SmallInt(32767), [](sql::RowReader& r) { return r.Int16("v"); }) == 32767);

  // narrower columns widen on read
  assert(Echo(sql::SmallInt(-5), [](sql::RowReader& r) { return r.Int64("v"); }) == -5);
}

void TestScalarExtremes() {
  assert(Echo(sql::TinyInt(127), [](sql::RowReader& r) { return r.Int8("v"); }) == 127);
  assert(Echo(sql::SmallInt(-32768), [](sql::RowReader& r) { return r.Int16("v"); }) == -32768);

  using F = std::numeric_limits<float>;
  using D = std::numeric_limits<double>;
  assert(Echo(sql::Real(F::lowest()), [](sql::RowReader& r) { return r.Float("v"); }) == F::lowest());
  assert(Echo(sql::Real(F::max()), [](sql::RowReader& r) { return r.Float("v"); }) == F::max());
  assert(Echo(sql::Double(D::lowest()), [](sql::RowReader& r) { return r.Double("v"); }) == D::lowest());
  assert(Echo(sql::Double(D::max()), [](sql::RowReader& r) { return r.Double("v"); }) == D::max());

  const model::Date first = sys_days{year::min() / January / 1};
  const model::Date last  = sys_days{year::max() / December / 31};
  assert(Echo(sql::Date(first), [](sql::RowReader& r) { return r.Date("v"); }) == first);
  assert(Echo(sql::Date(last), [](sql::RowReader& r) { return r.Date("v"); }) == last);
}

void TestFloatingAndBoolean() {
  assert(Echo(sql::Double(1.5), [](sql::RowReader& r) { return r.Double("v"); }) == 1.5);
  assert(Echo(sql::Real(0.25f), [](sql::RowReader& r) { return r.Float("v"); }) == 0.25f);
  assert(Echo(sql::Boolean(true), [](sql::RowReader& r) { return r.Bool("v"); }));
  assert(!Echo(sql::Boolean(false), [](sql::RowReader& r) { return r.Bool("v"); }));
}

void TestDecimalKeepsScaleAndPrecision() {
  const auto small = Echo(sql::Decimal("12.3400"), [](sql::RowReader& r) { return r.Decimal("v"); });
  assert(small == model::Decimal::Parse("12.34"));
  assert(small.Scale() == 4);

  const std::string wide_text = "1234567890123456789012345678.0123456789";
  const auto        wide      = Echo(sql::Decimal(wide_text), [](sql::RowReader& r) { return r.Decimal("v"); });
  assert(wide.ToString() == wide_text);

  const auto negative = Echo(sql::Decimal("-0.5"), [](sql::RowReader& r) { return r.Decimal("v"); });
  assert(negative == model::Decimal::Parse("-0.50"));
}

void TestTextIsExact() {
  const std::string unicode = "h\xC3\xA9llo w\xC3\xB6rld \xE2\x98\x83 \xF0\x9F\xA6\x86";
  assert(Echo(sql::VarChar(unicode), [](sql::RowReader& r) { return r.String("v"); }) == unicode);

  // empty string and NULL stay distinct
  const auto empty = Echo("SELECT CAST($v AS VARCHAR) AS v", sql::VarChar(""),
                          [](sql::RowReader& r) { return r.StringOrNone("v"); });
  assert(empty && empty->empty());

  const auto null = Echo("SELECT CAST($v AS VARCHAR) AS v", sql::kNull,
                         [](sql::RowReader& r) { return r.StringOrNone("v"); });
  assert(!null);

  assert(Echo(sql::Json("{\"a\":[1,2]}"), [](sql::RowReader& r) { return r.Json("v"); }) == "{\"a\":[1,2]}");
  assert(Echo("SELECT CAST($v AS BIT) AS v", sql::Bit("010110"), [](sql::RowReader& r) { return r.Bit("v"); }) ==
         "010110");
}

void TestNullTextPointerStoresEmptyString() {
  const auto target = sql::InMemory("types_text", false);
  const auto rows   = sql::Execute(
      target.Query("CREATE TABLE t (id INTEGER, v VARCHAR); "
                   "INSERT INTO t VALUES (1, $absent), (2, $empty); "
                   "SELECT id, v, v = '' AS is_empty FROM t ORDER BY id")
          .Parameters({{"absent", sql::VarChar(static_cast<const char*>(nullptr))}, {"empty", sql::VarChar("")}}),
      [](sql::RowReader& r) {
        assert(r.Bool("is_empty"));
        assert(r.StringOrNone("v").has_value());
        return r.String("v");
      });
  assert((rows == std::vector<std::string>{"", ""}));
}

void TestBlobBytes() {
  model::Bytes all(256);
  for (int i = 0; i < 256; ++i) {
    all[i] = static_cast<std::uint8_t>(i);
  }
  assert(Echo(sql::Blob(all), [](sql::RowReader& r) { return r.Blob("v"); }) == all);

  const auto empty = Echo(sql::Blob({}), [](sql::RowReader& r) { return r.BlobOrNone("v"); });
  assert(empty && empty->empty());

  const auto none = Echo("SELECT CAST($v AS BLOB) AS v", sql::BlobOrNone(std::nullopt),
                         [](sql::RowReader& r) { return r.BlobOrNone("v"); });
  assert(!none);
}

void TestUuid() {
  const auto id = model::Uuid::Generate();
  assert(Echo(sql::Uuid(id), [](sql::RowReader& r) { return r.Uuid("v"); }) == id);

  const auto ids = std::vector<model::Uuid>{model::Uuid::Generate(), model::Uuid::Generate()};
  assert(Echo(sql::UuidList(ids), [](sql::RowReader& r) { return r.UuidList("v"); }) == ids);
}

void TestTemporalRoundTrips() {
  const model::Date leap = sys_days{2024y / February / 29};
  assert(Echo(sql::Date(leap), [](sql::RowReader& r) { return r.Date("v"); }) == leap);

  const model::TimeOfDay last = hours{23} + minutes{59} + seconds{59} + microseconds{999999};
  assert(Echo(sql::Time(last), [](sql::RowReader& r) { return r.Time("v"); }) == last);

  const model::Timestamp ts = local_days{2024y / July / 1} + hours{13} + microseconds{5};
  assert(Echo(sql::Timestamp(ts), [](sql::RowReader& r) { return r.Timestamp("v"); }) == ts);

  const model::TimestampTz instant = sys_days{2001y / September / 9} + hours{1} + minutes{46} + seconds{40};
  assert(Echo(sql::TimestampTz(instant), [](sql::RowReader& r) { return r.TimestampTz("v"); }) == instant);

  const model::DateTimeOffset local{ts, hours{2}};
  const auto                  back =
      Echo(sql::TimestampTz(local), [](sql::RowReader& r) { return r.TimestampTzOffset("v"); });
  assert(back.offset == seconds{0});
  assert(back.UtcTime() == local.UtcTime());

  const model::Interval iv{14, 3, 4'000'005};
  assert(Echo(sql::Interval(iv), [](sql::RowReader& r) { return r.Interval("v"); }) == iv);
}

void TestTimeTzKeepsOffset() {
  const model::TimeOfDay time = hours{12} + minutes{34} + seconds{56} + microseconds{123456};
  const auto back = Echo(sql::TimeTz(time, hours{5} + minutes{30}), [](sql::RowReader& r) { return r.TimeTz("v"); });
  assert(back.offset == hours{5} + minutes{30});
  assert(back.UtcTime() == hours{7} + minutes{4} + seconds{56} + microseconds{123456});
}

void TestListsRoundTrip() {
  const std::vector<std::int32_t> ints{1, -2, 3};
  assert(Echo(sql::IntegerList(ints), [](sql::RowReader& r) { return r.IntList("v"); }) == ints);

  assert(Echo(sql::IntegerList({}), [](sql::RowReader& r) { return r.IntList("v"); }).empty());

  const std::vector<std::int64_t> bigs{std::numeric_limits<std::int64_t>::max(), 0};
  assert(Echo(sql::BigIntList(bigs), [](sql::RowReader& r) { return r.Int64List("v"); }) == bigs);

  const std::vector<std::int16_t> smalls{7, 8};
  assert(Echo(sql::SmallIntList(smalls), [](sql::RowReader& r) { return r.Int16List("v"); }) == smalls);

  const std::vector<double> doubles{0.5, -1.25};
  assert(Echo(sql::DoubleList(doubles), [](sql::RowReader& r) { return r.DoubleList("v"); }) == doubles);

  const std::vector<std::optional<std::string>> names{"a", std::nullopt, ""};
  assert(Echo(sql::VarCharList(names), [](sql::RowReader& r) { return r.StringList("v"); }) == names);

  const auto decimals = Echo(sql::DecimalList({model::Decimal::Parse("1.5"), model::Decimal::Parse("2.25")}),
                             [](sql::RowReader& r) { return r.DecimalList("v"); });
  assert(decimals.size() == 2);
  assert(decimals[1] == model::Decimal::Parse("2.25"));

  // NULL element in a typed list
  const auto with_null = Echo("SELECT [1, NULL, 3] AS v", sql::kNull, [](sql::RowReader& r) { return r.IntListWithNulls("v"); });
  assert(with_null.size() == 3 && !with_null[1]);

  bool threw = false;
  try {
    (void)Echo("SELECT [1, NULL, 3] AS v", sql::kNull, [](sql::RowReader& r) { return r.IntList("v"); });
  } catch (const util::InvalidCast&) {
    threw = true;
  }
  assert(threw);
}

void TestDecimalListWithMixedScales() {
  // 28 integer digits and 10 fractional digits share one 38-digit element type
  const std::vector<model::Decimal> mixed{model::Decimal::Parse("1234567890123456789012345678"),
                                          model::Decimal::Parse("0.0123456789")};
  const auto back = Echo(sql::DecimalList(mixed), [](sql::RowReader& r) { return r.DecimalList("v"); });
  assert(back == mixed);

  bool overflow = false;
  try {
    (void)Echo(sql::DecimalList({model::Decimal::Parse("12345678901234567890123456789"),
                                 model::Decimal::Parse("0.0123456789")}),
               [](sql::RowReader& r) { return r.DecimalList("v"); });
  } catch (const std::overflow_error&) {
    overflow = true;
  }
  assert(overflow);
}

void TestRawParameterForcesType() {
  ducksql::db::Parameter raw{"", ducksql::db::Value(std::string("42")), ducksql::db::DbType::kBigInt};
  const auto             column_type = Echo("SELECT typeof($v) AS t", sql::Raw(raw), [](sql::RowReader& r) {
    return r.String("t");
  });
  assert(column_type == "BIGINT");
}

void TestParameterNamesAndExtras() {
  const auto props = sql::InMemory("params", false).Query("SELECT $a + $b AS total");

  const auto read = [](sql::RowReader& r) { return r.Int64("total"); };
  assert(sql::ExecuteRow(props.Parameters({{"$a", sql::Integer(1)}, {"@b", sql::Integer(2)}}), read) == 3);
  assert(sql::ExecuteRow(props.Parameters({{" a ", sql::Integer(1)}, {"b", sql::Integer(5)}}), read) == 6);

  // unreferenced parameters are ignored
  assert(sql::ExecuteRow(props.Parameters({{"a", sql::Integer(1)}, {"b", sql::Integer(1)}, {"c", sql::Integer(9)}}),
                         read) == 2);

  // a repeated name binds its last value
  assert(sql::ExecuteRow(props.Parameters({{"a", sql::Integer(1)}, {"b", sql::Integer(1)}, {"a", sql::Integer(10)}}),
                         read) == 11);
}

void TestEngineRejectsBadValues() {
  bool threw = false;
  try {
    (void)Echo("SELECT CAST($v AS INTEGER) AS v", sql::VarChar("not a number"),
               [](sql::RowReader& r) { return r.Int("v"); });
  } catch (const util::InvalidCast&) {
    assert(false && "conversion failures come from the engine");
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
}

void TestColumnsAndUnknownColumn() {
  const auto props = sql::InMemory("columns", false).Query("SELECT 1::INTEGER AS id, 'x' AS name");
  try {
    (void)sql::ExecuteRow(props, [](sql::RowReader& r) { return r.Int("missing"); });
    assert(false && "unknown column must throw");
  } catch (const util::UnknownColumn& e) {
    assert(std::string(e.what()) ==
           "Could not read column 'missing' as INTEGER. Available columns are [id: INTEGER], [name: VARCHAR]");
  }
}

} // namespace

int main() {
  TestIntegerBounds();
  TestScalarExtremes();
  TestFloatingAndBoolean();
  TestDecimalKeepsScaleAndPrecision();
  TestTextIsExact();
  TestNullTextPointerStoresEmptyString();
  TestBlobBytes();
  TestUuid();
  TestTemporalRoundTrips();
  TestTimeTzKeepsOffset();
  TestListsRoundTrip();
  TestDecimalListWithMixedScales();
  TestRawParameterForcesType();
  TestParameterNamesAndExtras();
  TestEngineRejectsBadValues();
  TestColumnsAndUnknownColumn();

  std::cout << "ducksql_integration_types: pass\n";
  return 0;
}
