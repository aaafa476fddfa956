#include "internal/db/sql/sql_row.hpp"

namespace ducksql::sql {

model::Bytes ReadAllBytes(db::BlobStream& stream) {
  if (stream.Position() != 0) {
    stream.Seek(0);
  }

  const auto   length = stream.Length();
  model::Bytes bytes(length);

  std::size_t total = 0;
  while (total < length) {
    const auto n = stream.Read(bytes.data() + total, length - total);
    if (n == 0) {
      break;
    }
    total += n;
  }

  if (total != length) {
    throw util::ShortRead("Failed to read BLOB: expected " + std::to_string(length) + " bytes, got " +
                          std::to_string(total));
  }
  return bytes;
}

RowReader::RowReader(db::Cursor& cursor) : cursor_(&cursor) {
  const int count = cursor.FieldCount();
  columns_.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    auto name = cursor.GetName(i);
    // first occurrence wins for duplicate names
    ordinals_.emplace(name, i);
    columns_.emplace_back(std::move(name), cursor.GetDataTypeName(i));
  }
}

int RowReader::Ordinal(const std::string& column, const std::string& expected_type) const {
  auto it = ordinals_.find(column);
  if (it == ordinals_.end()) {
    throw util::UnknownColumn(column, expected_type, columns_);
  }
  return it->second;
}

model::Bytes RowReader::ReadBlob(int ordinal, const std::string& column) const {
  const auto value = cursor_->GetValue(ordinal);
  if (value.IsNull()) {
    throw util::InvalidCast("Cannot read NULL as BLOB");
  }

  const auto* stream = value.GetIf<std::shared_ptr<db::BlobStream>>();
  if (stream == nullptr || !*stream) {
    throw util::UnknownColumn(column, "BLOB", columns_);
  }
  return ReadAllBytes(**stream);
}

} // namespace ducksql::sql
