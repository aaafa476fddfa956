#include "internal/core/session.hpp"

#include "internal/db/sql/parameter_binder.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ducksql::core {
namespace {

const sql::SqlProps& Validated(const sql::SqlProps& props) {
  if (!props.Sql()) {
    throw util::MissingQuery();
  }
  return props;
}

std::shared_ptr<db::Connection> Resolve(const sql::ExecutionTarget& target) {
  if (const auto* existing = std::get_if<sql::ExistingConnectionTarget>(&target)) {
    return existing->connection;
  }
  return factory::CreateConnection(sql::ConnectionStringFor(target));
}

// Engine errors raised because of a requested stop surface as cancellation.
template <typename F>
auto Guarded(const std::stop_token& token, const char* stage, F&& body) {
  try {
    return body();
  } catch (const util::OperationCancelled&) {
    throw;
  } catch (const std::exception& e) {
    if (token.stop_requested()) {
      DUCKSQL_LOG_INFO("operation cancelled",
                       {observability::StringField("stage", stage), observability::StringField("error", e.what())});
      throw util::OperationCancelled(stage);
    }
    throw;
  }
}

} // namespace

void Checkpoint(const std::stop_token& token, const char* stage) {
  if (token.stop_requested()) {
    DUCKSQL_LOG_INFO("operation cancelled", {observability::StringField("stage", stage)});
    throw util::OperationCancelled(stage);
  }
}

void Interrupter::operator()() const noexcept {
  connection->Interrupt();
}

// ------------------------------------------------------------
// ConnectionLease
// ------------------------------------------------------------

ConnectionLease::ConnectionLease(const sql::ExecutionTarget& target, const std::stop_token& token)
    : connection_(Resolve(target)), owned_(sql::OwnsConnection(target)) {
  Checkpoint(token, "open");
  if (!connection_->IsOpen()) {
    connection_->Open();
  }
}

ConnectionLease::~ConnectionLease() {
  if (owned_) {
    connection_->Close();
  }
}

// ------------------------------------------------------------
// CommandScope / ReaderSession
// ------------------------------------------------------------

CommandScope::CommandScope(const sql::SqlProps& props, std::stop_token token)
    : token_(std::move(token)),
      lease_(Validated(props).Target(), token_),
      interrupt_(token_, Interrupter{&*lease_}) {
  Guarded(token_, "prepare", [&] {
    Checkpoint(token_, "prepare");
    command_ = lease_->CreateCommand(*props.Sql());
    if (props.IsFunction()) {
      command_->SetCommandType(db::CommandType::kStoredProcedure);
    }
    sql::BindParameters(*command_, props.GetParameters());
    if (props.NeedPrepare()) {
      command_->Prepare();
    }
  });
}

ReaderSession::ReaderSession(const sql::SqlProps& props, std::stop_token token) : scope_(props, std::move(token)) {
  Guarded(scope_.Token(), "execute", [&] {
    Checkpoint(scope_.Token(), "execute");
    cursor_ = scope_.Command().ExecuteReader();
    reader_.emplace(*cursor_);
  });
}

bool ReaderSession::Next() {
  return Guarded(scope_.Token(), "fetch", [&] {
    Checkpoint(scope_.Token(), "fetch");
    return cursor_->Read();
  });
}

// ------------------------------------------------------------
// Non-query / transaction
// ------------------------------------------------------------

std::int64_t RunNonQuery(const sql::SqlProps& props, const std::stop_token& token) {
  CommandScope scope(props, token);
  return Guarded(token, "execute", [&] {
    Checkpoint(token, "execute");
    return scope.Command().ExecuteNonQuery();
  });
}

std::vector<std::int64_t> RunTransaction(const sql::SqlProps&   props,
                                         const TransactionBatch& batch,
                                         const std::stop_token&  token) {
  if (batch.empty()) {
    return {};
  }

  ConnectionLease                 lease(props.Target(), token);
  std::stop_callback<Interrupter> interrupt(token, Interrupter{&*lease});

  return Guarded(token, "transaction", [&] {
    auto tx = lease->BeginTransaction();

    std::vector<std::int64_t> affected;
    affected.reserve(batch.size());

    for (const auto& [sql, parameter_sets] : batch) {
      if (parameter_sets.empty()) {
        Checkpoint(token, "execute");
        affected.push_back(lease->CreateCommand(sql)->ExecuteNonQuery());
        continue;
      }

      std::int64_t total = 0;
      for (const auto& parameters : parameter_sets) {
        Checkpoint(token, "execute");
        auto command = lease->CreateCommand(sql);
        sql::BindParameters(*command, parameters);
        total += command->ExecuteNonQuery();
      }
      affected.push_back(total);
    }

    Checkpoint(token, "commit");
    tx->Commit();
    return affected;
  });
}

} // namespace ducksql::core
