#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>

#include "internal/db/api/connection.hpp"
#include "internal/db/duckdb/connection_string.hpp"
#include "internal/db/sql/sql_value.hpp"

namespace ducksql::runtime::config {
class RuntimeConfig;
}

namespace ducksql::sql {

/*
  Execution targets.

  Only ExistingConnectionTarget is borrowed; every other target makes each
  call open and close its own connection.
*/
struct ExistingConnectionTarget {
  std::shared_ptr<db::Connection> connection;
};

struct ConnectionStringTarget {
  std::string connection_string;
};

struct FileTarget {
  std::string path;
  bool        read_only = false;
};

struct MemoryTarget {
  std::string name;
  bool        shared = true;
};

using ExecutionTarget = std::variant<ExistingConnectionTarget, ConnectionStringTarget, FileTarget, MemoryTarget>;

bool OwnsConnection(const ExecutionTarget& target);

/*
  Connection string per target:

    FileTarget{p, true}    Data Source=p;ACCESS_MODE=READ_ONLY
    FileTarget{p, false}   Data Source=p
    MemoryTarget{n, true}  Data Source=:memory:n?cache=shared
    MemoryTarget{n, false} Data Source=:memory:n
*/
std::string ConnectionStringFor(const ExecutionTarget& target);

/*
  Query configuration.

  Immutable: every builder step returns a modified copy.

    auto props = sql::InMemory("orders", true)
                     .Query("SELECT * FROM orders WHERE id = $id")
                     .Parameters({{"id", sql::Integer(7)}});
*/
class SqlProps {
 public:
  // Shared in-memory database named "default".
  SqlProps();

  SqlProps Connect(std::string connection_string) const;
  SqlProps ExistingConnection(std::shared_ptr<db::Connection> connection) const;
  SqlProps FileDb(std::string path, bool read_only) const;
  SqlProps InMemory(std::string name, bool shared) const;

  SqlProps Query(std::string sql) const;
  // `sql` names a stored macro / table function; parameters become its arguments.
  SqlProps Func(std::string sql) const;
  SqlProps Prepare() const;
  SqlProps Parameters(SqlParameters parameters) const;
  SqlProps CancellationToken(std::stop_token token) const;

  const ExecutionTarget&            Target() const { return target_; }
  const std::optional<std::string>& Sql() const { return sql_; }
  const SqlParameters&              GetParameters() const { return parameters_; }
  bool                              IsFunction() const { return is_function_; }
  bool                              NeedPrepare() const { return need_prepare_; }
  const std::stop_token&            Cancellation() const { return cancellation_; }

 private:
  ExecutionTarget            target_;
  std::optional<std::string> sql_;
  SqlParameters              parameters_;
  bool                       is_function_  = false;
  bool                       need_prepare_ = false;
  std::stop_token            cancellation_;
};

SqlProps Connect(std::string connection_string);
SqlProps ExistingConnection(std::shared_ptr<db::Connection> connection);
SqlProps FileDb(std::string path, bool read_only);
SqlProps InMemory(std::string name, bool shared);
SqlProps FromConnectionString(const db::duck::ConnectionStringBuilder& builder);

// Target, engine options and the prepare flag from RuntimeConfig.
SqlProps FromConfig(const runtime::config::RuntimeConfig& config);

} // namespace ducksql::sql
