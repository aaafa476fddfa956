#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/cursor.hpp"
#include "internal/util/errors.hpp"

namespace ducksql::sql {

// Seeks to 0 and copies the full declared length. Throws util::ShortRead otherwise.
model::Bytes ReadAllBytes(db::BlobStream& stream);

/*
  Typed, name-based access to the cursor's current row.

  Column names and declared types are captured once at construction; values
  are always read from the live cursor position. For each type there are
  three shapes:

    Int("n")               int32_t, throws util::InvalidCast on NULL
    IntOrNone("n")         std::optional<int32_t>
    TryInt("n", out)       false on NULL, out untouched

  An unknown name throws util::UnknownColumn listing every column.
*/
class RowReader {
 public:
  explicit RowReader(db::Cursor& cursor);

  db::Cursor& Cursor() const {
    return *cursor_;
  }
  int FieldCount() const {
    return static_cast<int>(columns_.size());
  }
  // (name, declared engine type) in cursor order.
  const util::UnknownColumn::ColumnList& Columns() const {
    return columns_;
  }

  // Ordinal of `column`; `expected_type` only feeds the error message.
  int Ordinal(const std::string& column, const std::string& expected_type) const;

  template <typename T>
  T Get(const std::string& column) const {
    const int ordinal = Ordinal(column, db::detail::TargetName<T>());
    return Read<T>(ordinal, column);
  }

  template <typename T>
  std::optional<T> GetOrNone(const std::string& column) const {
    const int ordinal = Ordinal(column, db::detail::TargetName<T>());
    if (cursor_->IsNull(ordinal)) {
      return std::nullopt;
    }
    return Read<T>(ordinal, column);
  }

  template <typename T>
  bool TryGet(const std::string& column, T& out) const {
    const int ordinal = Ordinal(column, db::detail::TargetName<T>());
    if (cursor_->IsNull(ordinal)) {
      return false;
    }
    out = Read<T>(ordinal, column);
    return true;
  }

  // ------------------------------------------------------------
  // Numbers
  // ------------------------------------------------------------

  std::int8_t                Int8(const std::string& c) const { return Get<std::int8_t>(c); }
  std::optional<std::int8_t> Int8OrNone(const std::string& c) const { return GetOrNone<std::int8_t>(c); }
  bool                       TryInt8(const std::string& c, std::int8_t& out) const { return TryGet(c, out); }

  std::int16_t                Int16(const std::string& c) const { return Get<std::int16_t>(c); }
  std::optional<std::int16_t> Int16OrNone(const std::string& c) const { return GetOrNone<std::int16_t>(c); }
  bool                        TryInt16(const std::string& c, std::int16_t& out) const { return TryGet(c, out); }

  std::int32_t                Int(const std::string& c) const { return Get<std::int32_t>(c); }
  std::optional<std::int32_t> IntOrNone(const std::string& c) const { return GetOrNone<std::int32_t>(c); }
  bool                        TryInt(const std::string& c, std::int32_t& out) const { return TryGet(c, out); }

  std::int64_t                Int64(const std::string& c) const { return Get<std::int64_t>(c); }
  std::optional<std::int64_t> Int64OrNone(const std::string& c) const { return GetOrNone<std::int64_t>(c); }
  bool                        TryInt64(const std::string& c, std::int64_t& out) const { return TryGet(c, out); }

  float                Float(const std::string& c) const { return Get<float>(c); }
  std::optional<float> FloatOrNone(const std::string& c) const { return GetOrNone<float>(c); }
  bool                 TryFloat(const std::string& c, float& out) const { return TryGet(c, out); }

  double                Double(const std::string& c) const { return Get<double>(c); }
  std::optional<double> DoubleOrNone(const std::string& c) const { return GetOrNone<double>(c); }
  bool                  TryDouble(const std::string& c, double& out) const { return TryGet(c, out); }

  model::Decimal                Decimal(const std::string& c) const { return Get<model::Decimal>(c); }
  std::optional<model::Decimal> DecimalOrNone(const std::string& c) const { return GetOrNone<model::Decimal>(c); }
  bool TryDecimal(const std::string& c, model::Decimal& out) const { return TryGet(c, out); }

  bool                Bool(const std::string& c) const { return Get<bool>(c); }
  std::optional<bool> BoolOrNone(const std::string& c) const { return GetOrNone<bool>(c); }
  bool                TryBool(const std::string& c, bool& out) const { return TryGet(c, out); }

  // ------------------------------------------------------------
  // Text and binary
  // ------------------------------------------------------------

  std::string                String(const std::string& c) const { return Get<std::string>(c); }
  std::optional<std::string> StringOrNone(const std::string& c) const { return GetOrNone<std::string>(c); }
  bool                       TryString(const std::string& c, std::string& out) const { return TryGet(c, out); }

  std::string                Text(const std::string& c) const { return String(c); }
  std::optional<std::string> TextOrNone(const std::string& c) const { return StringOrNone(c); }
  bool                       TryText(const std::string& c, std::string& out) const { return TryString(c, out); }

  std::string                Json(const std::string& c) const { return String(c); }
  std::optional<std::string> JsonOrNone(const std::string& c) const { return StringOrNone(c); }
  bool                       TryJson(const std::string& c, std::string& out) const { return TryString(c, out); }

  // BIT columns as "0101..."
  std::string                Bit(const std::string& c) const { return String(c); }
  std::optional<std::string> BitOrNone(const std::string& c) const { return StringOrNone(c); }
  bool                       TryBit(const std::string& c, std::string& out) const { return TryString(c, out); }

  model::Bytes                Blob(const std::string& c) const { return Get<model::Bytes>(c); }
  std::optional<model::Bytes> BlobOrNone(const std::string& c) const { return GetOrNone<model::Bytes>(c); }
  bool                        TryBlob(const std::string& c, model::Bytes& out) const { return TryGet(c, out); }

  model::Uuid                Uuid(const std::string& c) const { return Get<model::Uuid>(c); }
  std::optional<model::Uuid> UuidOrNone(const std::string& c) const { return GetOrNone<model::Uuid>(c); }
  bool                       TryUuid(const std::string& c, model::Uuid& out) const { return TryGet(c, out); }

  // ------------------------------------------------------------
  // Temporal
  // ------------------------------------------------------------

  model::Date                Date(const std::string& c) const { return Get<model::Date>(c); }
  std::optional<model::Date> DateOrNone(const std::string& c) const { return GetOrNone<model::Date>(c); }
  bool                       TryDate(const std::string& c, model::Date& out) const { return TryGet(c, out); }

  model::TimeOfDay                Time(const std::string& c) const { return Get<model::TimeOfDay>(c); }
  std::optional<model::TimeOfDay> TimeOrNone(const std::string& c) const { return GetOrNone<model::TimeOfDay>(c); }
  bool TryTime(const std::string& c, model::TimeOfDay& out) const { return TryGet(c, out); }

  // NOTE: returned exactly as stored (time of day + offset, no date). Compare
  // two values by UtcTime(), never by the local time of day.
  model::TimeTz                TimeTz(const std::string& c) const { return Get<model::TimeTz>(c); }
  std::optional<model::TimeTz> TimeTzOrNone(const std::string& c) const { return GetOrNone<model::TimeTz>(c); }
  bool                         TryTimeTz(const std::string& c, model::TimeTz& out) const { return TryGet(c, out); }

  model::Timestamp Timestamp(const std::string& c) const { return Get<model::Timestamp>(c); }
  std::optional<model::Timestamp> TimestampOrNone(const std::string& c) const {
    return GetOrNone<model::Timestamp>(c);
  }
  bool TryTimestamp(const std::string& c, model::Timestamp& out) const { return TryGet(c, out); }

  model::TimestampTz TimestampTz(const std::string& c) const { return Get<model::TimestampTz>(c); }
  std::optional<model::TimestampTz> TimestampTzOrNone(const std::string& c) const {
    return GetOrNone<model::TimestampTz>(c);
  }
  bool TryTimestampTz(const std::string& c, model::TimestampTz& out) const { return TryGet(c, out); }

  // UTC instant with a zero offset.
  model::DateTimeOffset TimestampTzOffset(const std::string& c) const { return Get<model::DateTimeOffset>(c); }
  std::optional<model::DateTimeOffset> TimestampTzOffsetOrNone(const std::string& c) const {
    return GetOrNone<model::DateTimeOffset>(c);
  }
  bool TryTimestampTzOffset(const std::string& c, model::DateTimeOffset& out) const { return TryGet(c, out); }

  model::Interval                Interval(const std::string& c) const { return Get<model::Interval>(c); }
  std::optional<model::Interval> IntervalOrNone(const std::string& c) const { return GetOrNone<model::Interval>(c); }
  bool TryInterval(const std::string& c, model::Interval& out) const { return TryGet(c, out); }

  // ------------------------------------------------------------
  // Lists
  // ------------------------------------------------------------

  // NULL elements stay in place as std::nullopt.
  std::vector<std::optional<std::string>> StringList(const std::string& c) const {
    return Get<std::vector<std::optional<std::string>>>(c);
  }
  std::optional<std::vector<std::optional<std::string>>> StringListOrNone(const std::string& c) const {
    return GetOrNone<std::vector<std::optional<std::string>>>(c);
  }
  bool TryStringList(const std::string& c, std::vector<std::optional<std::string>>& out) const {
    return TryGet(c, out);
  }

  // A NULL element throws util::InvalidCast; use IntListWithNulls to keep them.
  std::vector<std::int32_t> IntList(const std::string& c) const { return Get<std::vector<std::int32_t>>(c); }
  std::optional<std::vector<std::int32_t>> IntListOrNone(const std::string& c) const {
    return GetOrNone<std::vector<std::int32_t>>(c);
  }
  bool TryIntList(const std::string& c, std::vector<std::int32_t>& out) const { return TryGet(c, out); }
  std::vector<std::optional<std::int32_t>> IntListWithNulls(const std::string& c) const {
    return Get<std::vector<std::optional<std::int32_t>>>(c);
  }

  std::vector<std::int16_t> Int16List(const std::string& c) const { return Get<std::vector<std::int16_t>>(c); }
  std::optional<std::vector<std::int16_t>> Int16ListOrNone(const std::string& c) const {
    return GetOrNone<std::vector<std::int16_t>>(c);
  }
  bool TryInt16List(const std::string& c, std::vector<std::int16_t>& out) const { return TryGet(c, out); }

  std::vector<std::int64_t> Int64List(const std::string& c) const { return Get<std::vector<std::int64_t>>(c); }
  std::optional<std::vector<std::int64_t>> Int64ListOrNone(const std::string& c) const {
    return GetOrNone<std::vector<std::int64_t>>(c);
  }
  bool TryInt64List(const std::string& c, std::vector<std::int64_t>& out) const { return TryGet(c, out); }

  std::vector<double>                DoubleList(const std::string& c) const { return Get<std::vector<double>>(c); }
  std::optional<std::vector<double>> DoubleListOrNone(const std::string& c) const {
    return GetOrNone<std::vector<double>>(c);
  }
  bool TryDoubleList(const std::string& c, std::vector<double>& out) const { return TryGet(c, out); }

  std::vector<model::Decimal> DecimalList(const std::string& c) const { return Get<std::vector<model::Decimal>>(c); }
  std::optional<std::vector<model::Decimal>> DecimalListOrNone(const std::string& c) const {
    return GetOrNone<std::vector<model::Decimal>>(c);
  }
  bool TryDecimalList(const std::string& c, std::vector<model::Decimal>& out) const { return TryGet(c, out); }

  std::vector<model::Uuid> UuidList(const std::string& c) const { return Get<std::vector<model::Uuid>>(c); }
  std::optional<std::vector<model::Uuid>> UuidListOrNone(const std::string& c) const {
    return GetOrNone<std::vector<model::Uuid>>(c);
  }
  bool TryUuidList(const std::string& c, std::vector<model::Uuid>& out) const { return TryGet(c, out); }

 private:
  template <typename T>
  T Read(int ordinal, const std::string& column) const {
    if constexpr (std::is_same_v<T, model::Bytes>) {
      return ReadBlob(ordinal, column);
    } else {
      return cursor_->GetFieldValue<T>(ordinal);
    }
  }

  model::Bytes ReadBlob(int ordinal, const std::string& column) const;

  db::Cursor*                          cursor_;
  std::unordered_map<std::string, int> ordinals_;
  util::UnknownColumn::ColumnList      columns_;
};

} // namespace ducksql::sql
