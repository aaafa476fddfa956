#include "internal/db/api/value.hpp"

#include <algorithm>
#include <cstring>

namespace ducksql::db {

std::string_view TypeName(DbType type) {
  switch (type) {
    case DbType::kBoolean:
      return "BOOLEAN";
    case DbType::kTinyInt:
      return "TINYINT";
    case DbType::kSmallInt:
      return "SMALLINT";
    case DbType::kInteger:
      return "INTEGER";
    case DbType::kBigInt:
      return "BIGINT";
    case DbType::kFloat:
      return "FLOAT";
    case DbType::kDouble:
      return "DOUBLE";
    case DbType::kDecimal:
      return "DECIMAL";
    case DbType::kVarChar:
      return "VARCHAR";
    case DbType::kJson:
      return "JSON";
    case DbType::kBit:
      return "BIT";
    case DbType::kBlob:
      return "BLOB";
    case DbType::kUuid:
      return "UUID";
    case DbType::kDate:
      return "DATE";
    case DbType::kTime:
      return "TIME";
    case DbType::kTimeTz:
      return "TIME WITH TIME ZONE";
    case DbType::kTimestamp:
      return "TIMESTAMP";
    case DbType::kTimestampTz:
      return "TIMESTAMP WITH TIME ZONE";
    case DbType::kInterval:
      return "INTERVAL";
    case DbType::kList:
      return "LIST";
    case DbType::kUnknown:
      break;
  }
  return "UNKNOWN";
}

bool ValueList::operator==(const ValueList& other) const {
  return element_type == other.element_type && items == other.items;
}

std::string_view Value::TypeName() const {
  return std::visit(
      [](const auto& v) -> std::string_view {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
          return db::TypeName(DbType::kBoolean);
        } else if constexpr (std::is_same_v<T, std::int8_t>) {
          return db::TypeName(DbType::kTinyInt);
        } else if constexpr (std::is_same_v<T, std::int16_t>) {
          return db::TypeName(DbType::kSmallInt);
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
          return db::TypeName(DbType::kInteger);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return db::TypeName(DbType::kBigInt);
        } else if constexpr (std::is_same_v<T, float>) {
          return db::TypeName(DbType::kFloat);
        } else if constexpr (std::is_same_v<T, double>) {
          return db::TypeName(DbType::kDouble);
        } else if constexpr (std::is_same_v<T, model::Decimal>) {
          return db::TypeName(DbType::kDecimal);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return db::TypeName(DbType::kVarChar);
        } else if constexpr (std::is_same_v<T, model::Bytes> || std::is_same_v<T, std::shared_ptr<BlobStream>>) {
          return db::TypeName(DbType::kBlob);
        } else if constexpr (std::is_same_v<T, model::Uuid>) {
          return db::TypeName(DbType::kUuid);
        } else if constexpr (std::is_same_v<T, model::Date>) {
          return db::TypeName(DbType::kDate);
        } else if constexpr (std::is_same_v<T, model::TimeOfDay>) {
          return db::TypeName(DbType::kTime);
        } else if constexpr (std::is_same_v<T, model::TimeTz>) {
          return db::TypeName(DbType::kTimeTz);
        } else if constexpr (std::is_same_v<T, model::Timestamp>) {
          return db::TypeName(DbType::kTimestamp);
        } else if constexpr (std::is_same_v<T, model::TimestampTz>) {
          return db::TypeName(DbType::kTimestampTz);
        } else if constexpr (std::is_same_v<T, model::Interval>) {
          return db::TypeName(DbType::kInterval);
        } else {
          return db::TypeName(DbType::kList);
        }
      },
      storage_);
}

std::size_t MemoryBlobStream::Read(std::uint8_t* buffer, std::size_t count) {
  const auto n = std::min(count, length_ - position_);
  if (n > 0) {
    std::memcpy(buffer, data_ + position_, n);
    position_ += n;
  }
  return n;
}

} // namespace ducksql::db
