#pragma once

#include <duckdb.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/duckdb/connection_string.hpp"

namespace ducksql::db::duck {

/*
  Process-wide registry of open DuckDB instances.

  - shared in-memory (":memory:<name>?cache=shared"): held strongly, so the
    data outlives every connection until Evict()
  - file databases: held weakly; concurrent connections share one instance,
    the file is released when the last connection closes
  - private in-memory: never cached, one instance per connection

  Engine options only apply when an instance is created.
*/
class DatabaseCache {
 public:
  static DatabaseCache& Instance();

  std::shared_ptr<::duckdb::DuckDB> Acquire(const ConnectionStringBuilder& builder);

  // Drops a shared in-memory instance by source (":memory:<name>"). Open
  // connections keep it alive until they close.
  bool Evict(const std::string& source);

  std::size_t SharedCount() const;

 private:
  DatabaseCache() = default;

  static std::shared_ptr<::duckdb::DuckDB> Create(const ConnectionStringBuilder& builder);

  mutable std::mutex                                                 mutex_;
  std::unordered_map<std::string, std::shared_ptr<::duckdb::DuckDB>> shared_;
  std::unordered_map<std::string, std::weak_ptr<::duckdb::DuckDB>>   files_;
};

} // namespace ducksql::db::duck
