#include "internal/db/duckdb/duckdb_connection.hpp"

#include <stdexcept>

#include "internal/db/duckdb/duckdb_command.hpp"
#include "internal/db/duckdb/duckdb_database_cache.hpp"
#include "internal/db/duckdb/duckdb_tx.hpp"
#include "internal/observability/logging.hpp"

namespace ducksql::db::duck {

DuckdbConnection::DuckdbConnection(std::string connection_string)
    : connection_string_(std::move(connection_string)), builder_(ConnectionStringBuilder::Parse(connection_string_)) {
}

DuckdbConnection::~DuckdbConnection() {
  Close();
}

void DuckdbConnection::Open() {
  if (connection_) {
    return;
  }

  auto database = DatabaseCache::Instance().Acquire(builder_);
  connection_   = std::make_unique<::duckdb::Connection>(*database);
  database_     = std::move(database);

  DUCKSQL_LOG_DEBUG("connection opened", {observability::StringField("source", builder_.Source())});
}

void DuckdbConnection::Close() {
  if (!connection_) {
    return;
  }

  connection_.reset();
  database_.reset();

  DUCKSQL_LOG_DEBUG("connection closed", {observability::StringField("source", builder_.Source())});
}

::duckdb::Connection& DuckdbConnection::Native() {
  if (!connection_) {
    throw std::logic_error("Connection is not open");
  }
  return *connection_;
}

std::unique_ptr<Command> DuckdbConnection::CreateCommand(std::string text) {
  return std::make_unique<DuckdbCommand>(*this, std::move(text));
}

std::unique_ptr<Transaction> DuckdbConnection::BeginTransaction() {
  return std::make_unique<DuckdbTransaction>(Native());
}

void DuckdbConnection::Interrupt() {
  if (connection_) {
    connection_->Interrupt();
  }
}

} // namespace ducksql::db::duck
