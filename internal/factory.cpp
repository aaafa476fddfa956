#include "factory.hpp"

#include "internal/db/duckdb/duckdb_connection.hpp"

namespace ducksql::factory {

std::shared_ptr<db::Connection> CreateConnection(const std::string& connection_string) {
  return std::make_shared<db::duck::DuckdbConnection>(connection_string);
}

} // namespace ducksql::factory
