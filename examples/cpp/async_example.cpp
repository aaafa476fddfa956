#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <stop_token>
#include <thread>

#include "ducksql/v1.hpp"

namespace {

namespace v1  = ducksql::v1;
namespace sql = v1::sql;

} // namespace

int main() {
  const auto target = sql::InMemory("async_demo", true);

  try {
    (void)sql::ExecuteNonQueryAsync(
        target.Query("CREATE OR REPLACE TABLE events AS SELECT i::BIGINT AS id FROM range(1000) t(i)"))
        .get();

    auto total = sql::ExecuteRowAsync(target.Query("SELECT sum(id)::BIGINT AS total FROM events"),
                                      [](sql::RowReader& row) { return row.Int64("total"); });
    std::cout << "total: " << total.get() << '\n';

    auto rows = sql::ToSeqAsync(target.Query("SELECT id FROM events WHERE id < $n ORDER BY id").Parameters(
                                    {{"n", sql::BigInt(3)}}),
                                [](sql::RowReader& row) { return row.Int64("id"); });
    auto it   = rows.Enumerate();
    while (it.MoveNextAsync().get()) {
      std::cout << "event " << it.Current() << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "async example failed: " << e.what() << '\n';
    return 1;
  }

  // Cancel a long scan once a few rows have streamed through.
  std::stop_source          source;
  std::atomic<std::int64_t> seen{0};
  auto                      scan = sql::IterAsync(
      target.Query("SELECT i FROM range(10000000000) t(i)").CancellationToken(source.get_token()),
      [&](sql::RowReader&) { ++seen; });

  while (seen.load() < 1000) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  source.request_stop();

  try {
    scan.get();
  } catch (const v1::OperationCancelled& e) {
    std::cout << e.what() << " after " << seen.load() << " rows\n";
  } catch (const std::exception& e) {
    std::cerr << "scan failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
