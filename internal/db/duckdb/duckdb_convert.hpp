#pragma once

#include <duckdb.hpp>

#include "internal/db/api/parameter.hpp"
#include "internal/db/api/value.hpp"

namespace ducksql::db::duck {

/*
  Value mapping between the engine-neutral db::Value and duckdb::Value.
*/

::duckdb::LogicalType ToLogicalType(DbType type);
DbType                FromLogicalType(const ::duckdb::LogicalType& type);

// Binding: inferred engine type, or the parameter's explicit one.
::duckdb::Value ToDuckValue(const Value& value);
::duckdb::Value ToDuckValue(const Parameter& parameter);

// Reading. BLOBs are copied into Bytes; cursors stream them instead.
Value FromDuckValue(const ::duckdb::Value& value);

} // namespace ducksql::db::duck
