#include "internal/core/sql_props.hpp"

#include <map>
#include <stdexcept>

#include "config/config.pb.h"

namespace ducksql::sql {

bool OwnsConnection(const ExecutionTarget& target) {
  return !std::holds_alternative<ExistingConnectionTarget>(target);
}

std::string ConnectionStringFor(const ExecutionTarget& target) {
  return std::visit(
      [](const auto& t) -> std::string {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, ExistingConnectionTarget>) {
          return t.connection ? t.connection->ConnectionString() : std::string();
        } else if constexpr (std::is_same_v<T, ConnectionStringTarget>) {
          return t.connection_string;
        } else if constexpr (std::is_same_v<T, FileTarget>) {
          return t.read_only ? "Data Source=" + t.path + ";ACCESS_MODE=READ_ONLY" : "Data Source=" + t.path;
        } else {
          return t.shared ? "Data Source=:memory:" + t.name + "?cache=shared" : "Data Source=:memory:" + t.name;
        }
      },
      target);
}

// ------------------------------------------------------------
// SqlProps
// ------------------------------------------------------------

SqlProps::SqlProps() : target_(MemoryTarget{"default", true}) {
}

SqlProps SqlProps::Connect(std::string connection_string) const {
  auto next    = *this;
  next.target_ = ConnectionStringTarget{std::move(connection_string)};
  return next;
}

SqlProps SqlProps::ExistingConnection(std::shared_ptr<db::Connection> connection) const {
  if (!connection) {
    throw std::invalid_argument("ExistingConnection requires a connection");
  }
  auto next    = *this;
  next.target_ = ExistingConnectionTarget{std::move(connection)};
  return next;
}

SqlProps SqlProps::FileDb(std::string path, bool read_only) const {
  auto next    = *this;
  next.target_ = FileTarget{std::move(path), read_only};
  return next;
}

SqlProps SqlProps::InMemory(std::string name, bool shared) const {
  auto next    = *this;
  next.target_ = MemoryTarget{std::move(name), shared};
  return next;
}

SqlProps SqlProps::Query(std::string sql) const {
  auto next         = *this;
  next.sql_         = std::move(sql);
  next.is_function_ = false;
  return next;
}

SqlProps SqlProps::Func(std::string sql) const {
  auto next         = *this;
  next.sql_         = std::move(sql);
  next.is_function_ = true;
  return next;
}

SqlProps SqlProps::Prepare() const {
  auto next          = *this;
  next.need_prepare_ = true;
  return next;
}

SqlProps SqlProps::Parameters(SqlParameters parameters) const {
  auto next        = *this;
  next.parameters_ = std::move(parameters);
  return next;
}

SqlProps SqlProps::CancellationToken(std::stop_token token) const {
  auto next          = *this;
  next.cancellation_ = std::move(token);
  return next;
}

// ------------------------------------------------------------
// Entry points
// ------------------------------------------------------------

SqlProps Connect(std::string connection_string) {
  return SqlProps().Connect(std::move(connection_string));
}

SqlProps ExistingConnection(std::shared_ptr<db::Connection> connection) {
  return SqlProps().ExistingConnection(std::move(connection));
}

SqlProps FileDb(std::string path, bool read_only) {
  return SqlProps().FileDb(std::move(path), read_only);
}

SqlProps InMemory(std::string name, bool shared) {
  return SqlProps().InMemory(std::move(name), shared);
}

SqlProps FromConnectionString(const db::duck::ConnectionStringBuilder& builder) {
  return Connect(builder.ToString());
}

SqlProps FromConfig(const runtime::config::RuntimeConfig& config) {
  using TargetConfig = runtime::config::TargetConfig;

  const auto& target = config.target();
  SqlProps    props;

  switch (target.kind_case()) {
    case TargetConfig::kConnectionString:
      props = Connect(target.connection_string());
      break;
    case TargetConfig::kFile:
      props = FileDb(target.file().path(), target.file().read_only());
      break;
    case TargetConfig::kMemory:
      props = InMemory(target.memory().name(), target.memory().shared());
      break;
    case TargetConfig::KIND_NOT_SET:
      break;
  }

  if (!config.engine().options().empty()) {
    auto builder = db::duck::ConnectionStringBuilder::Parse(ConnectionStringFor(props.Target()));
    // protobuf maps are unordered
    std::map<std::string, std::string> options(config.engine().options().begin(), config.engine().options().end());
    for (const auto& [key, value] : options) {
      builder.SetOption(key, value);
    }
    props = props.Connect(builder.ToString());
  }

  if (config.execution().prepare()) {
    props = props.Prepare();
  }
  return props;
}

} // namespace ducksql::sql
