#pragma once

#include <duckdb.hpp>

#include <memory>
#include <string>

#include "internal/db/api/connection.hpp"
#include "internal/db/duckdb/connection_string.hpp"

namespace ducksql::db::duck {

/*
  DuckDB connection.

  Open() resolves the database instance through DatabaseCache; Close()
  drops this connection's reference to it.
*/
class DuckdbConnection final : public db::Connection {
 public:
  explicit DuckdbConnection(std::string connection_string);
  ~DuckdbConnection() override;

  DuckdbConnection(const DuckdbConnection&)            = delete;
  DuckdbConnection& operator=(const DuckdbConnection&) = delete;

  void Open() override;
  void Close() override;
  bool IsOpen() const override {
    return connection_ != nullptr;
  }

  const std::string& ConnectionString() const override {
    return connection_string_;
  }

  std::unique_ptr<Command>     CreateCommand(std::string text) override;
  std::unique_ptr<Transaction> BeginTransaction() override;

  void Interrupt() override;

  // Throws std::logic_error when closed.
  ::duckdb::Connection& Native();

 private:
  std::string                           connection_string_;
  ConnectionStringBuilder               builder_;
  std::shared_ptr<::duckdb::DuckDB>     database_;
  std::unique_ptr<::duckdb::Connection> connection_;
};

} // namespace ducksql::db::duck
