#include <cstdint>
#include <exception>
#include <iostream>

#include "ducksql/v1.hpp"

namespace {

namespace v1  = ducksql::v1;
namespace sql = v1::sql;

constexpr const char* kConfig = R"(logging:
  level: info
target:
  memory:
    name: ledger
    shared: true
execution:
  prepare: true
)";

std::int64_t Balance(const sql::SqlProps& target, std::int32_t id) {
  return sql::ExecuteRow(target.Query("SELECT balance FROM accounts WHERE id = $id").Parameters({{"id", sql::Integer(id)}}),
                         [](sql::RowReader& row) { return row.Int64("balance"); });
}

} // namespace

int main() {
  try {
    const auto config = v1::ConfigLoader::LoadFromYamlString(kConfig);
    ducksql::observability::InitializeLogging(config);
    const auto target = sql::FromConfig(config);

    (void)sql::ExecuteNonQuery(
        target.Query("CREATE OR REPLACE TABLE accounts (id INTEGER PRIMARY KEY, balance BIGINT NOT NULL)"));

    const sql::TransactionBatch open_accounts = {
        {"INSERT INTO accounts VALUES ($id, $balance)",
         {{{"id", sql::Integer(1)}, {"balance", sql::BigInt(100)}},
          {{"id", sql::Integer(2)}, {"balance", sql::BigInt(50)}}}},
    };
    const auto opened = sql::ExecuteTransaction(target, open_accounts);
    std::cout << "opened " << opened[0] << " accounts\n";

    const sql::TransactionBatch transfer = {
        {"UPDATE accounts SET balance = balance - $amount WHERE id = $id",
         {{{"id", sql::Integer(1)}, {"amount", sql::BigInt(30)}}}},
        {"UPDATE accounts SET balance = balance + $amount WHERE id = $id",
         {{{"id", sql::Integer(2)}, {"amount", sql::BigInt(30)}}}},
    };
    (void)sql::ExecuteTransaction(target, transfer);
    std::cout << "after transfer: " << Balance(target, 1) << " / " << Balance(target, 2) << '\n';

    // The duplicate key aborts the batch; the first update is rolled back.
    const sql::TransactionBatch broken = {
        {"UPDATE accounts SET balance = 0 WHERE id = 1", {}},
        {"INSERT INTO accounts VALUES (2, 0)", {}},
    };
    try {
      (void)sql::ExecuteTransaction(target, broken);
    } catch (const std::exception& e) {
      std::cout << "rolled back: " << e.what() << '\n';
    }
    std::cout << "after rollback: " << Balance(target, 1) << " / " << Balance(target, 2) << '\n';

    ducksql::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    std::cerr << "transaction example failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
