#pragma once

#include <duckdb.hpp>

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/command.hpp"

namespace ducksql::db::duck {

class DuckdbConnection;

/*
  Command over one or more SQL statements.

  Statements run in order; all but the last run to completion, the last one
  produces the cursor / affected-row count. Each statement is compiled just
  before it runs so later statements may reference objects created by earlier
  ones. Each statement receives only the parameters it references.
*/
class DuckdbCommand final : public db::Command {
 public:
  DuckdbCommand(DuckdbConnection& connection, std::string text);

  const std::string& Text() const override {
    return text_;
  }
  void SetText(std::string text) override;

  CommandType GetCommandType() const override {
    return command_type_;
  }
  void SetCommandType(CommandType type) override;

  ParameterCollection& Parameters() override {
    return parameters_;
  }

  void Prepare() override;

  std::unique_ptr<Cursor> ExecuteReader() override;
  std::int64_t            ExecuteNonQuery() override;

 private:
  struct Step {
    std::unique_ptr<::duckdb::SQLStatement>      statement;
    std::unique_ptr<::duckdb::PreparedStatement> prepared;
  };

  // SELECT wrapper for a stored macro / function call.
  std::string RoutineSql();

  void                         Parse();
  ::duckdb::PreparedStatement& Compile(Step& step);

  ::duckdb::case_insensitive_map_t<::duckdb::BoundParameterData> BindValues(
      const ::duckdb::PreparedStatement& prepared) const;

  std::unique_ptr<::duckdb::QueryResult> Run(::duckdb::PreparedStatement& prepared, bool stream);

  // Runs every statement; returns the last result.
  std::unique_ptr<::duckdb::QueryResult> RunAll(bool stream_last);

  DuckdbConnection&   connection_;
  std::string         text_;
  CommandType         command_type_ = CommandType::kText;
  ParameterCollection parameters_;
  std::vector<Step>   steps_;
  bool                parsed_ = false;
};

} // namespace ducksql::db::duck
