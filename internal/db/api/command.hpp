#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/cursor.hpp"
#include "internal/db/api/parameter.hpp"

namespace ducksql::db {

enum class CommandType {
  kText,
  // Text names a stored macro / function; bound parameters become its arguments.
  kStoredProcedure
};

/*
  One SQL command against a connection.

  Parameters are collected first and handed to the engine at execution;
  type errors surface there, never while adding.
*/
class Command {
 public:
  virtual ~Command() = default;

  virtual const std::string& Text() const        = 0;
  virtual void               SetText(std::string text) = 0;

  virtual CommandType GetCommandType() const            = 0;
  virtual void        SetCommandType(CommandType type) = 0;

  virtual ParameterCollection& Parameters() = 0;

  // Compile now instead of at first execution.
  virtual void Prepare() = 0;

  virtual std::unique_ptr<Cursor> ExecuteReader() = 0;

  // Rows inserted / updated / deleted by the last statement, 0 for anything else.
  virtual std::int64_t ExecuteNonQuery() = 0;
};

} // namespace ducksql::db
