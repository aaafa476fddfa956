#pragma once

#include <duckdb.hpp>

#include <memory>
#include <vector>

#include "internal/db/api/cursor.hpp"

namespace ducksql::db::duck {

/*
  Cursor over a (usually streaming) QueryResult.

  Rows are pulled chunk by chunk; the current row is materialized as
  duckdb::Values so BLOB streams can point into it.
*/
class DuckdbCursor final : public db::Cursor {
 public:
  explicit DuckdbCursor(std::unique_ptr<::duckdb::QueryResult> result);

  int         FieldCount() const override;
  std::string GetName(int ordinal) const override;
  std::string GetDataTypeName(int ordinal) const override;

  bool Read() override;

  bool  IsNull(int ordinal) const override;
  Value GetValue(int ordinal) const override;

 private:
  const ::duckdb::Value& Cell(int ordinal) const;

  std::unique_ptr<::duckdb::QueryResult> result_;
  std::unique_ptr<::duckdb::DataChunk>   chunk_;
  ::duckdb::idx_t                        next_row_ = 0;
  std::vector<::duckdb::Value>           row_;
  bool                                   exhausted_ = false;
};

} // namespace ducksql::db::duck
