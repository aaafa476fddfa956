#pragma once

#include <string_view>

namespace ducksql::db {

/*
  Engine-neutral column/parameter type.

  Used as the element type of bound lists and as the explicit type hint of a
  raw parameter. Everything else is inferred from the host value.
*/
enum class DbType {
  kBoolean,
  kTinyInt,
  kSmallInt,
  kInteger,
  kBigInt,
  kFloat,
  kDouble,
  kDecimal,
  kVarChar,
  kJson,
  kBit,
  kBlob,
  kUuid,
  kDate,
  kTime,
  kTimeTz,
  kTimestamp,
  kTimestampTz,
  kInterval,
  kList,
  kUnknown
};

// Engine spelling: "INTEGER", "VARCHAR", "TIMESTAMP WITH TIME ZONE", ...
std::string_view TypeName(DbType type);

} // namespace ducksql::db
