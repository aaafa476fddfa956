#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/core/executor.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace {

namespace sql  = ducksql::sql;
namespace util = ducksql::util;

std::int32_t ReadId(sql::RowReader& row) {
  return row.Int("id");
}

sql::SqlProps SeededTarget() {
  const auto target = sql::InMemory("async_items", true);
  (void)sql::ExecuteNonQuery(
      target.Query("CREATE OR REPLACE TABLE items AS SELECT i::INTEGER AS id FROM range(1, 6) t(i)"));
  return target;
}

void TestAsyncMatchesSync() {
  const auto target = SeededTarget();
  const auto query  = target.Query("SELECT id FROM items WHERE id >= $min ORDER BY id").Parameters(
      {{"min", sql::Integer(2)}});

  const auto sync  = sql::Execute(query, ReadId);
  const auto async = sql::ExecuteAsync(query, ReadId).get();
  assert((sync == std::vector<std::int32_t>{2, 3, 4, 5}));
  assert(sync == async);

  assert(sql::ExecuteRowAsync(query, ReadId).get() == sql::ExecuteRow(query, ReadId));

  std::vector<std::int32_t> visited;
  sql::IterAsync(query, [&](sql::RowReader& row) { visited.push_back(row.Int("id")); }).get();
  assert(visited == sync);

  auto                      rows = sql::ToSeqAsync(query, ReadId);
  std::vector<std::int32_t> streamed;
  auto                      it = rows.Enumerate();
  while (it.MoveNextAsync().get()) {
    streamed.push_back(it.Current());
  }
  assert(streamed == sync);

  // a second enumeration starts over
  auto again = rows.Enumerate();
  assert(again.MoveNextAsync().get());
  assert(again.Current() == 2);
}

void TestAsyncWritesAndTransactions() {
  const auto target = SeededTarget();

  assert(sql::ExecuteNonQueryAsync(target.Query("DELETE FROM items WHERE id > $max").Parameters(
                                       {{"max", sql::Integer(3)}}))
             .get() == 2);

  sql::TransactionBatch batch = {
      {"INSERT INTO items VALUES ($id)", {{{"id", sql::Integer(10)}}, {{"id", sql::Integer(11)}}}},
      {"DELETE FROM items WHERE id = 1", {}},
  };
  const auto counts = sql::ExecuteTransactionAsync(target, std::move(batch)).get();
  assert((counts == std::vector<std::int64_t>{2, 1}));

  assert(sql::ExecuteRowAsync(target.Query("SELECT count(*) AS n FROM items"),
                              [](sql::RowReader& row) { return row.Int64("n"); })
             .get() == 4);
}

void TestAsyncErrorsPropagate() {
  const auto target = sql::InMemory("async_errors", false);

  bool missing = false;
  try {
    (void)sql::ExecuteAsync(target, ReadId).get();
  } catch (const util::MissingQuery&) {
    missing = true;
  }
  assert(missing);

  bool empty = false;
  try {
    (void)sql::ExecuteRowAsync(target.Query("SELECT 1 AS id WHERE false"), ReadId).get();
  } catch (const util::NoResults&) {
    empty = true;
  }
  assert(empty);
}

void TestCancelledBeforeStart() {
  std::stop_source source;
  source.request_stop();

  const auto target = SeededTarget().CancellationToken(source.get_token());

  bool cancelled = false;
  try {
    (void)sql::ExecuteAsync(target.Query("SELECT id FROM items"), ReadId).get();
  } catch (const util::OperationCancelled&) {
    cancelled = true;
  }
  assert(cancelled);

  cancelled = false;
  try {
    (void)sql::ExecuteNonQueryAsync(target.Query("DELETE FROM items")).get();
  } catch (const util::OperationCancelled&) {
    cancelled = true;
  }
  assert(cancelled);

  // nothing was deleted; sync calls ignore the token
  assert(sql::ExecuteRow(target.Query("SELECT count(*) AS n FROM items"),
                         [](sql::RowReader& row) { return row.Int64("n"); }) == 5);
}

void TestCancelledWhileStreaming() {
  std::stop_source          source;
  std::atomic<std::int64_t> seen{0};

  const auto props = sql::InMemory("async_stream", false)
                         .Query("SELECT i AS id FROM range(10000000000) t(i)")
                         .CancellationToken(source.get_token());

  auto done = sql::IterAsync(props, [&](sql::RowReader& row) {
    (void)row.Int64("id");
    ++seen;
  });

  while (seen.load() == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  source.request_stop();

  bool cancelled = false;
  try {
    done.get();
  } catch (const util::OperationCancelled& e) {
    cancelled = std::string(e.what()).rfind("Operation cancelled during", 0) == 0;
  }
  assert(cancelled);
  assert(seen.load() > 0);
}

void TestSyncIgnoresToken() {
  std::stop_source source;
  source.request_stop();

  const auto query = SeededTarget().Query("SELECT id FROM items ORDER BY id").CancellationToken(source.get_token());
  assert(sql::Execute(query, ReadId).size() == 5);
}

} // namespace

int main() {
  TestAsyncMatchesSync();
  TestAsyncWritesAndTransactions();
  TestAsyncErrorsPropagate();
  TestCancelledBeforeStart();
  TestCancelledWhileStreaming();
  TestSyncIgnoresToken();

  std::cout << "ducksql_integration_async: pass\n";
  return 0;
}
