#include "internal/core/executor.hpp"

namespace ducksql::sql {

std::int64_t ExecuteNonQuery(const SqlProps& props) {
  return core::RunNonQuery(props, std::stop_token{});
}

std::vector<std::int64_t> ExecuteTransaction(const SqlProps& props, const TransactionBatch& batch) {
  return core::RunTransaction(props, batch, std::stop_token{});
}

std::future<std::int64_t> ExecuteNonQueryAsync(SqlProps props) {
  return std::async(std::launch::async,
                    [props = std::move(props)]() { return core::RunNonQuery(props, props.Cancellation()); });
}

std::future<std::vector<std::int64_t>> ExecuteTransactionAsync(SqlProps props, TransactionBatch batch) {
  return std::async(std::launch::async, [props = std::move(props), batch = std::move(batch)]() {
    return core::RunTransaction(props, batch, props.Cancellation());
  });
}

} // namespace ducksql::sql
