#pragma once

#include <string>
#include <string_view>

#include "internal/db/api/command.hpp"
#include "internal/db/sql/sql_value.hpp"

namespace ducksql::sql {

/*
  Parameter binding.

  "$id", "@id", " id " and "id" all bind the statement parameter $id.
  Values are erased to db::Value and typed by the engine; nothing is
  checked here, mismatches fail at execution.
*/

// Trims whitespace, then strips every leading '$' / '@'.
std::string NormalizeParameterName(std::string_view name);

db::Parameter ToParameter(std::string_view name, const SqlValue& value);

// Appends to command.Parameters() in list order.
void BindParameters(db::Command& command, const SqlParameters& parameters);

} // namespace ducksql::sql
