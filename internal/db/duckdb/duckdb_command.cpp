#include "internal/db/duckdb/duckdb_command.hpp"

#include <cctype>
#include <stdexcept>

#include "internal/db/duckdb/duckdb_connection.hpp"
#include "internal/db/duckdb/duckdb_convert.hpp"
#include "internal/db/duckdb/duckdb_cursor.hpp"
#include "internal/observability/logging.hpp"

namespace ducksql::db::duck {
namespace {

std::string Trim(const std::string& s) {
  size_t begin = 0;
  size_t end   = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

std::string QuoteIdentifier(const std::string& name) {
  std::string quoted = "\"";
  for (char c : name) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  return quoted + "\"";
}

void ThrowIfFailed(::duckdb::QueryResult& result) {
  if (result.HasError()) {
    result.ThrowError();
  }
}

std::int64_t AffectedRows(::duckdb::QueryResult& result) {
  if (result.properties.return_type != ::duckdb::StatementReturnType::CHANGED_ROWS) {
    return 0;
  }
  auto chunk = result.Fetch();
  ThrowIfFailed(result);
  if (!chunk || chunk->size() == 0) {
    return 0;
  }
  return chunk->GetValue(0, 0).GetValue<int64_t>();
}

} // namespace

DuckdbCommand::DuckdbCommand(DuckdbConnection& connection, std::string text)
    : connection_(connection), text_(std::move(text)) {
}

void DuckdbCommand::SetText(std::string text) {
  text_   = std::move(text);
  parsed_ = false;
  steps_.clear();
}

void DuckdbCommand::SetCommandType(CommandType type) {
  command_type_ = type;
  parsed_       = false;
  steps_.clear();
}

// ------------------------------------------------------------
// Stored routines
// ------------------------------------------------------------

std::string DuckdbCommand::RoutineSql() {
  auto call = Trim(text_);
  if (call.empty()) {
    throw std::invalid_argument("Stored routine name is empty");
  }

  auto name = call.substr(0, call.find('('));
  name      = Trim(name.substr(name.rfind('.') == std::string::npos ? 0 : name.rfind('.') + 1));

  if (call.find('(') == std::string::npos) {
    std::string args;
    int         positional = 0;
    for (const auto& parameter : parameters_) {
      if (!args.empty()) args += ", ";
      args += "$" + (parameter.name.empty() ? std::to_string(++positional) : parameter.name);
    }
    call += "(" + args + ")";
  }

  auto& native = connection_.Native();
  auto  lookup = native.Prepare(
      "SELECT function_type FROM duckdb_functions() WHERE lower(function_name) = lower($1) "
       "ORDER BY function_type LIMIT 1");
  if (lookup->HasError()) {
    lookup->error.Throw();
  }
  ::duckdb::vector<::duckdb::Value> lookup_args{::duckdb::Value(name)};
  auto                              kind_result = lookup->Execute(lookup_args, false);
  ThrowIfFailed(*kind_result);

  std::string kind;
  if (auto chunk = kind_result->Fetch(); chunk && chunk->size() > 0) {
    kind = chunk->GetValue(0, 0).ToString();
  }

  if (kind == "table" || kind == "table_macro") {
    return "SELECT * FROM " + call;
  }
  return "SELECT " + call + " AS " + QuoteIdentifier(name);
}

// ------------------------------------------------------------
// Compilation
// ------------------------------------------------------------

void DuckdbCommand::Parse() {
  if (parsed_) {
    return;
  }

  const auto sql = command_type_ == CommandType::kStoredProcedure ? RoutineSql() : text_;

  auto statements = connection_.Native().ExtractStatements(sql);
  if (statements.empty()) {
    throw std::invalid_argument("Command text contains no SQL statement");
  }

  steps_.clear();
  for (auto& statement : statements) {
    steps_.push_back(Step{std::move(statement), nullptr});
  }
  parsed_ = true;
}

::duckdb::PreparedStatement& DuckdbCommand::Compile(Step& step) {
  if (!step.prepared) {
    // the parsed statement survives a failed prepare so the command can be retried
    auto prepared = connection_.Native().Prepare(step.statement->Copy());
    if (prepared->HasError()) {
      prepared->error.Throw();
    }
    step.prepared = std::move(prepared);
  }
  return *step.prepared;
}

void DuckdbCommand::Prepare() {
  Parse();
  Compile(steps_.front());
}

// ------------------------------------------------------------
// Execution
// ------------------------------------------------------------

::duckdb::case_insensitive_map_t<::duckdb::BoundParameterData> DuckdbCommand::BindValues(
    const ::duckdb::PreparedStatement& prepared) const {
  ::duckdb::case_insensitive_map_t<::duckdb::BoundParameterData> values;

  int positional = 0;
  for (const auto& parameter : parameters_) {
    const auto key = parameter.name.empty() ? std::to_string(++positional) : parameter.name;
    if (prepared.named_param_map.find(key) == prepared.named_param_map.end()) {
      if (observability::IsEnabled(spdlog::level::debug)) {
        DUCKSQL_LOG_DEBUG("parameter not referenced by statement", {observability::StringField("name", key)});
      }
      continue;
    }
    // later duplicates overwrite earlier ones
    values.insert_or_assign(key, ::duckdb::BoundParameterData(ToDuckValue(parameter)));
  }
  return values;
}

std::unique_ptr<::duckdb::QueryResult> DuckdbCommand::Run(::duckdb::PreparedStatement& prepared, bool stream) {
  auto values = BindValues(prepared);
  auto result = prepared.Execute(values, stream);
  ThrowIfFailed(*result);
  return result;
}

std::unique_ptr<::duckdb::QueryResult> DuckdbCommand::RunAll(bool stream_last) {
  Parse();

  std::unique_ptr<::duckdb::QueryResult> result;
  for (size_t i = 0; i < steps_.size(); ++i) {
    const bool last = i + 1 == steps_.size();
    // release the previous result before the next statement runs
    result.reset();
    result = Run(Compile(steps_[i]), last && stream_last);
  }
  return result;
}

std::unique_ptr<Cursor> DuckdbCommand::ExecuteReader() {
  return std::make_unique<DuckdbCursor>(RunAll(true));
}

std::int64_t DuckdbCommand::ExecuteNonQuery() {
  auto result = RunAll(false);
  return AffectedRows(*result);
}

} // namespace ducksql::db::duck
