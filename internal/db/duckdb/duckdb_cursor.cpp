#include "internal/db/duckdb/duckdb_cursor.hpp"

#include <stdexcept>

#include "internal/db/duckdb/duckdb_convert.hpp"

namespace ducksql::db::duck {

DuckdbCursor::DuckdbCursor(std::unique_ptr<::duckdb::QueryResult> result) : result_(std::move(result)) {
}

int DuckdbCursor::FieldCount() const {
  return static_cast<int>(result_->ColumnCount());
}

std::string DuckdbCursor::GetName(int ordinal) const {
  return result_->names.at(static_cast<size_t>(ordinal));
}

std::string DuckdbCursor::GetDataTypeName(int ordinal) const {
  return result_->types.at(static_cast<size_t>(ordinal)).ToString();
}

bool DuckdbCursor::Read() {
  if (exhausted_) {
    return false;
  }

  while (!chunk_ || next_row_ >= chunk_->size()) {
    chunk_    = result_->Fetch();
    next_row_ = 0;
    if (!chunk_) {
      if (result_->HasError()) {
        result_->ThrowError();
      }
      exhausted_ = true;
      row_.clear();
      return false;
    }
  }

  row_.resize(chunk_->ColumnCount());
  for (::duckdb::idx_t col = 0; col < chunk_->ColumnCount(); ++col) {
    row_[col] = chunk_->GetValue(col, next_row_);
  }
  ++next_row_;
  return true;
}

const ::duckdb::Value& DuckdbCursor::Cell(int ordinal) const {
  if (row_.empty()) {
    throw std::logic_error("No current row: call Read() first");
  }
  return row_.at(static_cast<size_t>(ordinal));
}

bool DuckdbCursor::IsNull(int ordinal) const {
  return Cell(ordinal).IsNull();
}

Value DuckdbCursor::GetValue(int ordinal) const {
  const auto& cell = Cell(ordinal);
  if (!cell.IsNull() && cell.type().id() == ::duckdb::LogicalTypeId::BLOB) {
    const auto& raw = ::duckdb::StringValue::Get(cell);
    return std::shared_ptr<BlobStream>(
        std::make_shared<MemoryBlobStream>(reinterpret_cast<const std::uint8_t*>(raw.data()), raw.size()));
  }
  return FromDuckValue(cell);
}

} // namespace ducksql::db::duck
