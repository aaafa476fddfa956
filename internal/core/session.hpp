#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "internal/core/sql_props.hpp"
#include "internal/db/api/connection.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace ducksql::core {

/*
  Shared execution machinery behind every sql::Execute* call.

  One path serves sync and async callers: sync passes an empty stop_token,
  async passes the caller's. The token is checked before open, prepare,
  execute, every fetch and commit; once stop is requested the running
  statement is interrupted and the call fails with util::OperationCancelled.
*/

// Throws util::OperationCancelled when stop was requested.
void Checkpoint(const std::stop_token& token, const char* stage);

struct Interrupter {
  db::Connection* connection;

  void operator()() const noexcept;
};

/*
  Connection for the duration of one call.

  Owned targets get a fresh connection that is closed on destruction.
  A borrowed connection is opened if needed and never closed.
*/
class ConnectionLease {
 public:
  ConnectionLease(const sql::ExecutionTarget& target, const std::stop_token& token);
  ~ConnectionLease();

  ConnectionLease(const ConnectionLease&)            = delete;
  ConnectionLease& operator=(const ConnectionLease&) = delete;

  db::Connection& operator*() const { return *connection_; }
  db::Connection* operator->() const { return connection_.get(); }

  bool Owned() const { return owned_; }

 private:
  std::shared_ptr<db::Connection> connection_;
  bool                            owned_;
};

/*
  Validated, leased, bound and (optionally) compiled command.
*/
class CommandScope {
 public:
  CommandScope(const sql::SqlProps& props, std::stop_token token);

  db::Command&           Command() { return *command_; }
  const std::stop_token& Token() const { return token_; }

 private:
  std::stop_token                   token_;
  ConnectionLease                   lease_;
  std::stop_callback<Interrupter>   interrupt_;
  std::unique_ptr<db::Command>      command_;
};

/*
  Open cursor plus its RowReader. Releasing the session releases cursor,
  command and (owned) connection in that order.
*/
class ReaderSession {
 public:
  ReaderSession(const sql::SqlProps& props, std::stop_token token);

  // Advances to the next row; false once the cursor is exhausted.
  bool Next();

  sql::RowReader& Reader() { return *reader_; }

 private:
  CommandScope                scope_;
  std::unique_ptr<db::Cursor> cursor_;
  std::optional<sql::RowReader> reader_;
};

std::int64_t RunNonQuery(const sql::SqlProps& props, const std::stop_token& token);

using TransactionBatch = std::vector<std::pair<std::string, std::vector<sql::SqlParameters>>>;

std::vector<std::int64_t> RunTransaction(const sql::SqlProps&   props,
                                         const TransactionBatch& batch,
                                         const std::stop_token&  token);

} // namespace ducksql::core
