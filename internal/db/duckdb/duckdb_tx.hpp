#pragma once

#include "internal/db/api/transaction.hpp"

namespace duckdb {
class Connection;
}

namespace ducksql::db::duck {

/*
  Transaction on a single DuckDB connection.

  DuckDB transactions are connection-scoped: every command on the same
  connection runs inside it until Commit()/Rollback().
*/
class DuckdbTransaction final : public db::Transaction {
public:
  explicit DuckdbTransaction(::duckdb::Connection& connection);
  ~DuckdbTransaction() override;

  DuckdbTransaction(const DuckdbTransaction&)            = delete;
  DuckdbTransaction& operator=(const DuckdbTransaction&) = delete;

  void Commit() override;
  void Rollback() override;
  bool IsCompleted() const override { return completed_; }

private:
  ::duckdb::Connection& connection_;
  bool completed_ = false;
};

}
