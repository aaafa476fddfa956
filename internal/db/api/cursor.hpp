#pragma once

#include <string>

#include "internal/db/api/field_cast.hpp"
#include "internal/db/api/value.hpp"

namespace ducksql::db {

/*
  Forward-only result cursor.

  Schema (FieldCount / GetName / GetDataTypeName) is available right after
  execution; cell access needs a successful Read().
*/
class Cursor {
 public:
  virtual ~Cursor() = default;

  virtual int         FieldCount() const                 = 0;
  virtual std::string GetName(int ordinal) const         = 0;
  virtual std::string GetDataTypeName(int ordinal) const = 0;

  // Advance to the next row; false once exhausted.
  virtual bool Read() = 0;

  virtual bool  IsNull(int ordinal) const   = 0;
  virtual Value GetValue(int ordinal) const = 0;

  template <typename T>
  T GetFieldValue(int ordinal) const {
    return FieldCast<T>(GetValue(ordinal));
  }
};

} // namespace ducksql::db
