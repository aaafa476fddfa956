#include "internal/db/duckdb/duckdb_convert.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ducksql::db::duck {
namespace {

constexpr int kInt64DecimalWidth = 18;

::duckdb::Value DecimalValue(const model::Decimal& d) {
  if (d.Precision() <= kInt64DecimalWidth && d.Scale() <= kInt64DecimalWidth) {
    return ::duckdb::Value::DECIMAL(static_cast<int64_t>(d.Value()), kInt64DecimalWidth, d.Scale());
  }

  const auto          unscaled = d.Value();
  ::duckdb::hugeint_t wide;
  wide.lower = static_cast<uint64_t>(unscaled);
  wide.upper = static_cast<int64_t>(unscaled >> 64);
  return ::duckdb::Value::DECIMAL(wide, model::Decimal::kMaxPrecision, d.Scale());
}

::duckdb::Value BlobValue(const uint8_t* data, size_t size) {
  static const uint8_t kEmpty = 0;
  return ::duckdb::Value::BLOB(size == 0 ? &kEmpty : data, size);
}

::duckdb::Value ListValue(const ValueList& list) {
  ::duckdb::LogicalType child_type;
  if (list.element_type == DbType::kDecimal) {
    // wide enough for the longest integer part and the longest fraction
    int integer_digits = 0;
    int scale          = 0;
    for (const auto& item : list.items) {
      if (const auto* d = item.GetIf<model::Decimal>()) {
        integer_digits = std::max(integer_digits, d->Precision() - d->Scale());
        scale          = std::max(scale, static_cast<int>(d->Scale()));
      }
    }
    const int width = std::max(integer_digits + scale, 1);
    if (width > model::Decimal::kMaxPrecision) {
      throw std::overflow_error("Decimal list needs " + std::to_string(width) + " digits, more than " +
                                std::to_string(model::Decimal::kMaxPrecision));
    }
    child_type = ::duckdb::LogicalType::DECIMAL(static_cast<uint8_t>(width), static_cast<uint8_t>(scale));
  } else {
    child_type = ToLogicalType(list.element_type);
  }

  ::duckdb::vector<::duckdb::Value> children;
  children.reserve(list.items.size());
  for (const auto& item : list.items) {
    if (item.IsNull()) {
      children.emplace_back(child_type);
    } else {
      children.push_back(ToDuckValue(item).DefaultCastAs(child_type));
    }
  }
  return ::duckdb::Value::LIST(child_type, std::move(children));
}

Value DecimalOrText(const ::duckdb::Value& value) {
  auto text = value.ToString();
  try {
    return model::Decimal::Parse(text);
  } catch (const std::overflow_error&) {
    return text;
  }
}

Value ChildList(const ::duckdb::LogicalType& child_type, const ::duckdb::vector<::duckdb::Value>& children) {
  ValueList list;
  list.element_type = FromLogicalType(child_type);
  list.items.reserve(children.size());
  for (const auto& child : children) {
    list.items.push_back(FromDuckValue(child));
  }
  return list;
}

} // namespace

::duckdb::LogicalType ToLogicalType(DbType type) {
  using ::duckdb::LogicalType;
  switch (type) {
    case DbType::kBoolean:
      return LogicalType::BOOLEAN;
    case DbType::kTinyInt:
      return LogicalType::TINYINT;
    case DbType::kSmallInt:
      return LogicalType::SMALLINT;
    case DbType::kInteger:
      return LogicalType::INTEGER;
    case DbType::kBigInt:
      return LogicalType::BIGINT;
    case DbType::kFloat:
      return LogicalType::FLOAT;
    case DbType::kDouble:
      return LogicalType::DOUBLE;
    case DbType::kDecimal:
      return LogicalType::DECIMAL(model::Decimal::kMaxPrecision, 10);
    case DbType::kVarChar:
      return LogicalType::VARCHAR;
    case DbType::kJson:
      return LogicalType::JSON();
    case DbType::kBit:
      return LogicalType::BIT;
    case DbType::kBlob:
      return LogicalType::BLOB;
    case DbType::kUuid:
      return LogicalType::UUID;
    case DbType::kDate:
      return LogicalType::DATE;
    case DbType::kTime:
      return LogicalType::TIME;
    case DbType::kTimeTz:
      return LogicalType::TIME_TZ;
    case DbType::kTimestamp:
      return LogicalType::TIMESTAMP;
    case DbType::kTimestampTz:
      return LogicalType::TIMESTAMP_TZ;
    case DbType::kInterval:
      return LogicalType::INTERVAL;
    case DbType::kList:
    case DbType::kUnknown:
      break;
  }
  throw std::invalid_argument("No engine type for " + std::string(TypeName(type)));
}

DbType FromLogicalType(const ::duckdb::LogicalType& type) {
  using ::duckdb::LogicalTypeId;
  if (type.IsJSONType()) return DbType::kJson;
  switch (type.id()) {
    case LogicalTypeId::BOOLEAN:
      return DbType::kBoolean;
    case LogicalTypeId::TINYINT:
      return DbType::kTinyInt;
    case LogicalTypeId::SMALLINT:
    case LogicalTypeId::UTINYINT:
      return DbType::kSmallInt;
    case LogicalTypeId::INTEGER:
    case LogicalTypeId::USMALLINT:
      return DbType::kInteger;
    case LogicalTypeId::BIGINT:
    case LogicalTypeId::UINTEGER:
      return DbType::kBigInt;
    case LogicalTypeId::FLOAT:
      return DbType::kFloat;
    case LogicalTypeId::DOUBLE:
      return DbType::kDouble;
    case LogicalTypeId::DECIMAL:
    case LogicalTypeId::UBIGINT:
    case LogicalTypeId::HUGEINT:
    case LogicalTypeId::UHUGEINT:
      return DbType::kDecimal;
    case LogicalTypeId::VARCHAR:
      return DbType::kVarChar;
    case LogicalTypeId::BIT:
      return DbType::kBit;
    case LogicalTypeId::BLOB:
      return DbType::kBlob;
    case LogicalTypeId::UUID:
      return DbType::kUuid;
    case LogicalTypeId::DATE:
      return DbType::kDate;
    case LogicalTypeId::TIME:
      return DbType::kTime;
    case LogicalTypeId::TIME_TZ:
      return DbType::kTimeTz;
    case LogicalTypeId::TIMESTAMP:
    case LogicalTypeId::TIMESTAMP_SEC:
    case LogicalTypeId::TIMESTAMP_MS:
    case LogicalTypeId::TIMESTAMP_NS:
      return DbType::kTimestamp;
    case LogicalTypeId::TIMESTAMP_TZ:
      return DbType::kTimestampTz;
    case LogicalTypeId::INTERVAL:
      return DbType::kInterval;
    case LogicalTypeId::LIST:
    case LogicalTypeId::ARRAY:
      return DbType::kList;
    default:
      return DbType::kUnknown;
  }
}

::duckdb::Value ToDuckValue(const Value& value) {
  using ::duckdb::Value;
  return std::visit(
      [](const auto& v) -> ::duckdb::Value {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return Value();
        } else if constexpr (std::is_same_v<T, bool>) {
          return Value::BOOLEAN(v);
        } else if constexpr (std::is_same_v<T, std::int8_t>) {
          return Value::TINYINT(v);
        } else if constexpr (std::is_same_v<T, std::int16_t>) {
          return Value::SMALLINT(v);
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
          return Value::INTEGER(v);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return Value::BIGINT(v);
        } else if constexpr (std::is_same_v<T, float>) {
          return Value::FLOAT(v);
        } else if constexpr (std::is_same_v<T, double>) {
          return Value::DOUBLE(v);
        } else if constexpr (std::is_same_v<T, model::Decimal>) {
          return DecimalValue(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return Value(v);
        } else if constexpr (std::is_same_v<T, model::Bytes>) {
          return BlobValue(v.data(), v.size());
        } else if constexpr (std::is_same_v<T, std::shared_ptr<BlobStream>>) {
          model::Bytes bytes(v->Length());
          v->Seek(0);
          bytes.resize(v->Read(bytes.data(), bytes.size()));
          return BlobValue(bytes.data(), bytes.size());
        } else if constexpr (std::is_same_v<T, model::Uuid>) {
          return Value::UUID(v.ToString());
        } else if constexpr (std::is_same_v<T, model::Date>) {
          return Value::DATE(::duckdb::date_t(static_cast<int32_t>(v.time_since_epoch().count())));
        } else if constexpr (std::is_same_v<T, model::TimeOfDay>) {
          return Value::TIME(::duckdb::dtime_t(v.count()));
        } else if constexpr (std::is_same_v<T, model::TimeTz>) {
          return Value::TIMETZ(
              ::duckdb::dtime_tz_t(::duckdb::dtime_t(v.time.count()), static_cast<int32_t>(v.offset.count())));
        } else if constexpr (std::is_same_v<T, model::Timestamp>) {
          return Value::TIMESTAMP(::duckdb::timestamp_t(v.time_since_epoch().count()));
        } else if constexpr (std::is_same_v<T, model::TimestampTz>) {
          return Value::TIMESTAMPTZ(::duckdb::timestamp_tz_t(v.time_since_epoch().count()));
        } else if constexpr (std::is_same_v<T, model::Interval>) {
          ::duckdb::interval_t interval;
          interval.months = v.months;
          interval.days   = v.days;
          interval.micros = v.micros;
          return Value::INTERVAL(interval);
        } else {
          return ListValue(v);
        }
      },
      value.Get());
}

::duckdb::Value ToDuckValue(const Parameter& parameter) {
  auto value = ToDuckValue(parameter.value);
  if (!parameter.type) {
    return value;
  }

  if (*parameter.type == DbType::kDecimal) {
    const auto* d     = parameter.value.GetIf<model::Decimal>();
    const auto  scale = d ? d->Scale() : uint8_t{10};
    return value.DefaultCastAs(::duckdb::LogicalType::DECIMAL(model::Decimal::kMaxPrecision, scale));
  }
  if (value.IsNull()) {
    return ::duckdb::Value(ToLogicalType(*parameter.type));
  }
  return value.DefaultCastAs(ToLogicalType(*parameter.type));
}

Value FromDuckValue(const ::duckdb::Value& value) {
  using ::duckdb::LogicalTypeId;
  if (value.IsNull()) {
    return {};
  }

  const auto& type = value.type();
  switch (type.id()) {
    case LogicalTypeId::BOOLEAN:
      return ::duckdb::BooleanValue::Get(value);
    case LogicalTypeId::TINYINT:
      return ::duckdb::TinyIntValue::Get(value);
    case LogicalTypeId::SMALLINT:
      return ::duckdb::SmallIntValue::Get(value);
    case LogicalTypeId::INTEGER:
      return ::duckdb::IntegerValue::Get(value);
    case LogicalTypeId::BIGINT:
      return ::duckdb::BigIntValue::Get(value);
    case LogicalTypeId::UTINYINT:
      return static_cast<std::int16_t>(::duckdb::UTinyIntValue::Get(value));
    case LogicalTypeId::USMALLINT:
      return static_cast<std::int32_t>(::duckdb::USmallIntValue::Get(value));
    case LogicalTypeId::UINTEGER:
      return static_cast<std::int64_t>(::duckdb::UIntegerValue::Get(value));
    case LogicalTypeId::UBIGINT:
    case LogicalTypeId::HUGEINT:
    case LogicalTypeId::UHUGEINT:
    case LogicalTypeId::DECIMAL:
      return DecimalOrText(value);
    case LogicalTypeId::FLOAT:
      return ::duckdb::FloatValue::Get(value);
    case LogicalTypeId::DOUBLE:
      return ::duckdb::DoubleValue::Get(value);
    case LogicalTypeId::VARCHAR:
      return ::duckdb::StringValue::Get(value);
    case LogicalTypeId::BLOB: {
      const auto& raw = ::duckdb::StringValue::Get(value);
      return model::Bytes(raw.begin(), raw.end());
    }
    case LogicalTypeId::UUID:
      return model::Uuid::Parse(value.ToString());
    case LogicalTypeId::DATE:
      return model::Date{std::chrono::days{::duckdb::DateValue::Get(value).days}};
    case LogicalTypeId::TIME:
      return model::TimeOfDay{::duckdb::TimeValue::Get(value).micros};
    case LogicalTypeId::TIME_TZ:
      return model::TimeTz::Parse(value.ToString());
    case LogicalTypeId::TIMESTAMP:
      return model::Timestamp{std::chrono::microseconds{::duckdb::TimestampValue::Get(value).value}};
    case LogicalTypeId::TIMESTAMP_SEC:
    case LogicalTypeId::TIMESTAMP_MS:
    case LogicalTypeId::TIMESTAMP_NS: {
      const auto micros = value.DefaultCastAs(::duckdb::LogicalType::TIMESTAMP);
      return model::Timestamp{std::chrono::microseconds{::duckdb::TimestampValue::Get(micros).value}};
    }
    case LogicalTypeId::TIMESTAMP_TZ:
      return model::TimestampTz{std::chrono::microseconds{::duckdb::TimestampValue::Get(value).value}};
    case LogicalTypeId::INTERVAL: {
      const auto      interval = ::duckdb::IntervalValue::Get(value);
      model::Interval out;
      out.months = interval.months;
      out.days   = interval.days;
      out.micros = interval.micros;
      return out;
    }
    case LogicalTypeId::LIST:
      return ChildList(::duckdb::ListType::GetChildType(type), ::duckdb::ListValue::GetChildren(value));
    case LogicalTypeId::ARRAY:
      return ChildList(::duckdb::ArrayType::GetChildType(type), ::duckdb::ArrayValue::GetChildren(value));
    default:
      // BIT, ENUM, STRUCT, MAP, ...: engine text rendering
      return value.ToString();
  }
}

} // namespace ducksql::db::duck
