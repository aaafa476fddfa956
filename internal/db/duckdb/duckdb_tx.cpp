#include "duckdb_tx.hpp"

#include <duckdb.hpp>

#include "internal/observability/logging.hpp"

namespace ducksql::db::duck {

DuckdbTransaction::DuckdbTransaction(::duckdb::Connection& connection) : connection_(connection) {
  connection_.BeginTransaction();
}

DuckdbTransaction::~DuckdbTransaction() {
  if (!completed_) {
    try {
      connection_.Rollback();
      DUCKSQL_LOG_WARN("transaction rolled back");
    } catch (const std::exception& e) {
      DUCKSQL_LOG_WARN("transaction rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void DuckdbTransaction::Commit() {
  connection_.Commit();
  completed_ = true;
}

void DuckdbTransaction::Rollback() {
  connection_.Rollback();
  completed_ = true;
}

} // namespace ducksql::db::duck
