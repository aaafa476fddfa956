#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/api/parameter.hpp"
#include "internal/model/bytes.hpp"
#include "internal/model/decimal.hpp"
#include "internal/model/temporal.hpp"
#include "internal/model/uuid.hpp"

namespace ducksql::sql {

namespace value {

/*
  Typed SQL value.

  One alternative per engine type the library binds. The payload type is
  fixed by the tag, so an Integer can only ever carry an int32_t.
  Null carries no type: the target column decides.
*/

template <typename Tag, typename T>
struct Tagged {
  using value_type = T;

  T value;

  bool operator==(const Tagged&) const = default;
};

namespace tag {
struct TinyInt {};
struct SmallInt {};
struct Integer {};
struct BigInt {};
struct Real {};
struct Double {};
struct Decimal {};
struct Boolean {};
struct Bit {};
struct VarChar {};
struct Json {};
struct Blob {};
struct Uuid {};
struct Date {};
struct Time {};
struct TimeTz {};
struct Timestamp {};
struct TimestampTz {};
struct Interval {};
struct VarCharList {};
struct IntegerList {};
struct SmallIntList {};
struct BigIntList {};
struct DoubleList {};
struct DecimalList {};
struct UuidList {};
} // namespace tag

struct Null {
  bool operator==(const Null&) const = default;
};

// Caller-built driver parameter; the binder overwrites its name.
struct Raw {
  db::Parameter parameter;

  bool operator==(const Raw&) const = default;
};

using TinyInt     = Tagged<tag::TinyInt, std::int8_t>;
using SmallInt    = Tagged<tag::SmallInt, std::int16_t>;
using Integer     = Tagged<tag::Integer, std::int32_t>;
using BigInt      = Tagged<tag::BigInt, std::int64_t>;
using Real        = Tagged<tag::Real, float>;
using Double      = Tagged<tag::Double, double>;
using Decimal     = Tagged<tag::Decimal, model::Decimal>;
using Boolean     = Tagged<tag::Boolean, bool>;
using Bit         = Tagged<tag::Bit, std::string>;
using VarChar     = Tagged<tag::VarChar, std::string>;
using Json        = Tagged<tag::Json, std::string>;
using Blob        = Tagged<tag::Blob, model::Bytes>;
using Uuid        = Tagged<tag::Uuid, model::Uuid>;
using Date        = Tagged<tag::Date, model::Date>;
using Time        = Tagged<tag::Time, model::TimeOfDay>;
using TimeTz      = Tagged<tag::TimeTz, model::TimeTz>;
using Timestamp   = Tagged<tag::Timestamp, model::Timestamp>;
using TimestampTz = Tagged<tag::TimestampTz, model::TimestampTz>;
using Interval    = Tagged<tag::Interval, model::Interval>;

using VarCharList  = Tagged<tag::VarCharList, std::vector<std::optional<std::string>>>;
using IntegerList  = Tagged<tag::IntegerList, std::vector<std::int32_t>>;
using SmallIntList = Tagged<tag::SmallIntList, std::vector<std::int16_t>>;
using BigIntList   = Tagged<tag::BigIntList, std::vector<std::int64_t>>;
using DoubleList   = Tagged<tag::DoubleList, std::vector<double>>;
using DecimalList  = Tagged<tag::DecimalList, std::vector<model::Decimal>>;
using UuidList     = Tagged<tag::UuidList, std::vector<model::Uuid>>;

} // namespace value

using SqlValue = std::variant<value::Null,
                              value::Raw,
                              value::TinyInt,
                              value::SmallInt,
                              value::Integer,
                              value::BigInt,
                              value::Real,
                              value::Double,
                              value::Decimal,
                              value::Boolean,
                              value::Bit,
                              value::VarChar,
                              value::Json,
                              value::Blob,
                              value::Uuid,
                              value::Date,
                              value::Time,
                              value::TimeTz,
                              value::Timestamp,
                              value::TimestampTz,
                              value::Interval,
                              value::VarCharList,
                              value::IntegerList,
                              value::SmallIntList,
                              value::BigIntList,
                              value::DoubleList,
                              value::DecimalList,
                              value::UuidList>;

// Ordered (name, value) pairs. Names may repeat; the last one wins at the engine.
using SqlParameters = std::vector<std::pair<std::string, SqlValue>>;

} // namespace ducksql::sql
