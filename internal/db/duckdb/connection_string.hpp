#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ducksql::db::duck {

/*
  DuckDB connection string: "Data Source=<source>;KEY=VALUE;..."

  Data Source forms:
    <path>                    file database
    :memory:                  private in-memory database
    :memory:<name>            private in-memory database, named
    <any of the above>?cache=shared
                              one instance shared by every connection
                              using the same source

  Keys are case-insensitive. Keys other than Data Source are engine
  settings (ACCESS_MODE, threads, memory_limit, ...).
*/
class ConnectionStringBuilder {
 public:
  using Options = std::vector<std::pair<std::string, std::string>>;

  ConnectionStringBuilder() = default;

  static ConnectionStringBuilder Parse(std::string_view connection_string);

  ConnectionStringBuilder& SetDataSource(std::string data_source);
  const std::string&       DataSource() const {
    return data_source_;
  }

  // Replaces an existing option with the same (case-insensitive) key.
  ConnectionStringBuilder& SetOption(std::string key, std::string value);
  const Options&           GetOptions() const {
    return options_;
  }

  ConnectionStringBuilder& SetReadOnly(bool read_only);
  bool                     IsReadOnly() const;

  bool IsInMemory() const;
  bool IsSharedCache() const;

  // Data Source without the ?cache=shared suffix.
  std::string Source() const;

  // File path; empty for in-memory sources.
  std::string DatabasePath() const;

  std::string ToString() const;

 private:
  std::string data_source_;
  Options     options_;
};

} // namespace ducksql::db::duck
