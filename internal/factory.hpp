#pragma once

#include <memory>
#include <string>

#include "internal/db/api/connection.hpp"

namespace ducksql::factory {

/*
  CreateConnection

  Builds a closed engine connection for a connection string.

  NOTE:
  This is the composition root of the library.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Connection> CreateConnection(const std::string& connection_string);

} // namespace ducksql::factory
