#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/sql/sql_value.hpp"

namespace ducksql::sql {

/*
  SqlValue constructors.

    sql::Integer(42)
    sql::IntegerOrNone(maybe_count)      std::optional<int32_t>
    sql::IntegerOrNone(&field)           const int32_t*, nullptr -> NULL

  Every XOrNone accepts both absence shapes and maps absence to Null.
*/

inline const SqlValue kNull = value::Null{};

namespace detail {

template <typename V, typename T>
SqlValue OrNone(const std::optional<T>& v) {
  return v ? SqlValue{V{*v}} : SqlValue{value::Null{}};
}

template <typename V, typename T>
SqlValue OrNone(const T* v) {
  return v ? SqlValue{V{*v}} : SqlValue{value::Null{}};
}

} // namespace detail

inline SqlValue DbNull() {
  return value::Null{};
}

// Driver parameter passed through untouched apart from its name.
inline SqlValue Raw(db::Parameter parameter) {
  return value::Raw{std::move(parameter)};
}

// ------------------------------------------------------------
// Numbers
// ------------------------------------------------------------

inline SqlValue TinyInt(std::int8_t v) {
  return value::TinyInt{v};
}
inline SqlValue TinyIntOrNone(const std::optional<std::int8_t>& v) {
  return detail::OrNone<value::TinyInt>(v);
}
inline SqlValue TinyIntOrNone(const std::int8_t* v) {
  return detail::OrNone<value::TinyInt>(v);
}

inline SqlValue SmallInt(std::int16_t v) {
  return value::SmallInt{v};
}
inline SqlValue SmallIntOrNone(const std::optional<std::int16_t>& v) {
  return detail::OrNone<value::SmallInt>(v);
}
inline SqlValue SmallIntOrNone(const std::int16_t* v) {
  return detail::OrNone<value::SmallInt>(v);
}

inline SqlValue Integer(std::int32_t v) {
  return value::Integer{v};
}
inline SqlValue IntegerOrNone(const std::optional<std::int32_t>& v) {
  return detail::OrNone<value::Integer>(v);
}
inline SqlValue IntegerOrNone(const std::int32_t* v) {
  return detail::OrNone<value::Integer>(v);
}

inline SqlValue BigInt(std::int64_t v) {
  return value::BigInt{v};
}
inline SqlValue BigIntOrNone(const std::optional<std::int64_t>& v) {
  return detail::OrNone<value::BigInt>(v);
}
inline SqlValue BigIntOrNone(const std::int64_t* v) {
  return detail::OrNone<value::BigInt>(v);
}

inline SqlValue Real(float v) {
  return value::Real{v};
}
inline SqlValue RealOrNone(const std::optional<float>& v) {
  return detail::OrNone<value::Real>(v);
}
inline SqlValue RealOrNone(const float* v) {
  return detail::OrNone<value::Real>(v);
}

inline SqlValue Double(double v) {
  return value::Double{v};
}
inline SqlValue DoubleOrNone(const std::optional<double>& v) {
  return detail::OrNone<value::Double>(v);
}
inline SqlValue DoubleOrNone(const double* v) {
  return detail::OrNone<value::Double>(v);
}

inline SqlValue Decimal(model::Decimal v) {
  return value::Decimal{v};
}
// "12.3400"; throws std::invalid_argument on malformed text.
inline SqlValue Decimal(std::string_view text) {
  return value::Decimal{model::Decimal::Parse(text)};
}
inline SqlValue DecimalOrNone(const std::optional<model::Decimal>& v) {
  return detail::OrNone<value::Decimal>(v);
}
inline SqlValue DecimalOrNone(const model::Decimal* v) {
  return detail::OrNone<value::Decimal>(v);
}

inline SqlValue Boolean(bool v) {
  return value::Boolean{v};
}
inline SqlValue BooleanOrNone(const std::optional<bool>& v) {
  return detail::OrNone<value::Boolean>(v);
}
inline SqlValue BooleanOrNone(const bool* v) {
  return detail::OrNone<value::Boolean>(v);
}

// ------------------------------------------------------------
// Text and binary
// ------------------------------------------------------------

inline SqlValue VarChar(std::string v) {
  return value::VarChar{std::move(v)};
}
// NOTE: nullptr becomes "" here, not NULL. Use VarCharOrNone for a nullable column.
inline SqlValue VarChar(const char* v) {
  return value::VarChar{v ? std::string(v) : std::string()};
}
inline SqlValue VarCharOrNone(const std::optional<std::string>& v) {
  return detail::OrNone<value::VarChar>(v);
}
inline SqlValue VarCharOrNone(const char* v) {
  return v ? SqlValue{value::VarChar{v}} : SqlValue{value::Null{}};
}

inline SqlValue Text(std::string v) {
  return VarChar(std::move(v));
}
inline SqlValue Text(const char* v) {
  return VarChar(v);
}
inline SqlValue TextOrNone(const std::optional<std::string>& v) {
  return VarCharOrNone(v);
}
inline SqlValue TextOrNone(const char* v) {
  return VarCharOrNone(v);
}

// Bit string as text: "010110".
inline SqlValue Bit(std::string v) {
  return value::Bit{std::move(v)};
}
inline SqlValue BitOrNone(const std::optional<std::string>& v) {
  return detail::OrNone<value::Bit>(v);
}

inline SqlValue Json(std::string v) {
  return value::Json{std::move(v)};
}
inline SqlValue JsonOrNone(const std::optional<std::string>& v) {
  return detail::OrNone<value::Json>(v);
}

inline SqlValue Blob(model::Bytes v) {
  return value::Blob{std::move(v)};
}
inline SqlValue BlobOrNone(const std::optional<model::Bytes>& v) {
  return detail::OrNone<value::Blob>(v);
}
inline SqlValue BlobOrNone(const model::Bytes* v) {
  return detail::OrNone<value::Blob>(v);
}

inline SqlValue Uuid(model::Uuid v) {
  return value::Uuid{v};
}
inline SqlValue Uuid(const std::string& text) {
  return value::Uuid{model::Uuid::Parse(text)};
}
inline SqlValue UuidOrNone(const std::optional<model::Uuid>& v) {
  return detail::OrNone<value::Uuid>(v);
}
inline SqlValue UuidOrNone(const model::Uuid* v) {
  return detail::OrNone<value::Uuid>(v);
}

// ------------------------------------------------------------
// Temporal
// ------------------------------------------------------------

inline SqlValue Date(model::Date v) {
  return value::Date{v};
}
inline SqlValue Date(std::chrono::year_month_day v) {
  return value::Date{model::Date{v}};
}
// Time of day is dropped.
inline SqlValue Date(model::Timestamp v) {
  return value::Date{model::FloorToDate(v)};
}
inline SqlValue DateOrNone(const std::optional<model::Date>& v) {
  return detail::OrNone<value::Date>(v);
}
inline SqlValue DateOrNone(const model::Date* v) {
  return detail::OrNone<value::Date>(v);
}

inline SqlValue Time(model::TimeOfDay v) {
  return value::Time{v};
}
inline SqlValue TimeOrNone(const std::optional<model::TimeOfDay>& v) {
  return detail::OrNone<value::Time>(v);
}
inline SqlValue TimeOrNone(const model::TimeOfDay* v) {
  return detail::OrNone<value::Time>(v);
}

// NOTE: TIMETZ keeps only time of day + offset. Compare values by UtcTime().
inline SqlValue TimeTz(model::TimeTz v) {
  return value::TimeTz{v};
}
inline SqlValue TimeTz(model::TimeOfDay time, std::chrono::seconds offset) {
  return value::TimeTz{model::TimeTz{time, offset}};
}
inline SqlValue TimeTzOrNone(const std::optional<model::TimeTz>& v) {
  return detail::OrNone<value::TimeTz>(v);
}
inline SqlValue TimeTzOrNone(const model::TimeTz* v) {
  return detail::OrNone<value::TimeTz>(v);
}

inline SqlValue Timestamp(model::Timestamp v) {
  return value::Timestamp{v};
}
inline SqlValue TimestampOrNone(const std::optional<model::Timestamp>& v) {
  return detail::OrNone<value::Timestamp>(v);
}
inline SqlValue TimestampOrNone(const model::Timestamp* v) {
  return detail::OrNone<value::Timestamp>(v);
}

inline SqlValue TimestampTz(model::TimestampTz v) {
  return value::TimestampTz{v};
}
// Naive value taken as UTC.
inline SqlValue TimestampTz(model::Timestamp v) {
  return value::TimestampTz{model::AssumeUtc(v)};
}
inline SqlValue TimestampTz(const model::DateTimeOffset& v) {
  return value::TimestampTz{v.UtcTime()};
}
inline SqlValue TimestampTzOrNone(const std::optional<model::TimestampTz>& v) {
  return detail::OrNone<value::TimestampTz>(v);
}
inline SqlValue TimestampTzOrNone(const model::TimestampTz* v) {
  return detail::OrNone<value::TimestampTz>(v);
}
inline SqlValue TimestampTzOffsetOrNone(const std::optional<model::DateTimeOffset>& v) {
  return v ? TimestampTz(*v) : DbNull();
}

inline SqlValue Interval(model::Interval v) {
  return value::Interval{v};
}
inline SqlValue Interval(std::chrono::microseconds v) {
  return value::Interval{model::Interval::FromDuration(v)};
}
inline SqlValue IntervalOrNone(const std::optional<model::Interval>& v) {
  return detail::OrNone<value::Interval>(v);
}
inline SqlValue IntervalOrNone(const model::Interval* v) {
  return detail::OrNone<value::Interval>(v);
}

// ------------------------------------------------------------
// Lists
// ------------------------------------------------------------

inline SqlValue VarCharList(std::vector<std::optional<std::string>> v) {
  return value::VarCharList{std::move(v)};
}
inline SqlValue VarCharListOrNone(const std::optional<std::vector<std::optional<std::string>>>& v) {
  return detail::OrNone<value::VarCharList>(v);
}

inline SqlValue IntegerList(std::vector<std::int32_t> v) {
  return value::IntegerList{std::move(v)};
}
inline SqlValue IntegerListOrNone(const std::optional<std::vector<std::int32_t>>& v) {
  return detail::OrNone<value::IntegerList>(v);
}
inline SqlValue IntegerListOrNone(const std::vector<std::int32_t>* v) {
  return detail::OrNone<value::IntegerList>(v);
}

inline SqlValue SmallIntList(std::vector<std::int16_t> v) {
  return value::SmallIntList{std::move(v)};
}
inline SqlValue SmallIntListOrNone(const std::optional<std::vector<std::int16_t>>& v) {
  return detail::OrNone<value::SmallIntList>(v);
}

inline SqlValue BigIntList(std::vector<std::int64_t> v) {
  return value::BigIntList{std::move(v)};
}
inline SqlValue BigIntListOrNone(const std::optional<std::vector<std::int64_t>>& v) {
  return detail::OrNone<value::BigIntList>(v);
}

inline SqlValue DoubleList(std::vector<double> v) {
  return value::DoubleList{std::move(v)};
}
inline SqlValue DoubleListOrNone(const std::optional<std::vector<double>>& v) {
  return detail::OrNone<value::DoubleList>(v);
}

inline SqlValue DecimalList(std::vector<model::Decimal> v) {
  return value::DecimalList{std::move(v)};
}
inline SqlValue DecimalListOrNone(const std::optional<std::vector<model::Decimal>>& v) {
  return detail::OrNone<value::DecimalList>(v);
}

inline SqlValue UuidList(std::vector<model::Uuid> v) {
  return value::UuidList{std::move(v)};
}
inline SqlValue UuidListOrNone(const std::optional<std::vector<model::Uuid>>& v) {
  return detail::OrNone<value::UuidList>(v);
}

} // namespace ducksql::sql
