#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/db/api/value.hpp"

namespace ducksql::db {

/*
  Driver-side bound parameter.

  An empty name binds positionally, in the order unnamed parameters were added.
  `type` forces an explicit engine type; without it the type is inferred
  from the value.
*/
struct Parameter {
  std::string           name;
  Value                 value;
  std::optional<DbType> type;

  bool operator==(const Parameter&) const = default;
};

using ParameterCollection = std::vector<Parameter>;

} // namespace ducksql::db
