#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "ducksql/v1.hpp"

namespace {

namespace sql = ducksql::v1::sql;

struct Product {
  std::int32_t               id;
  std::string                name;
  ducksql::model::Decimal    price;
  std::optional<std::string> note;
};

Product ReadProduct(sql::RowReader& row) {
  return Product{row.Int("id"), row.String("name"), row.Decimal("price"), row.StringOrNone("note")};
}

} // namespace

int main(int argc, char** argv) {
  // Optional path to a database file; defaults to a shared in-memory database.
  const auto target = argc > 1 ? sql::FileDb(argv[1], false) : sql::InMemory("quickstart", true);

  try {
    (void)sql::ExecuteNonQuery(target.Query(
        "CREATE OR REPLACE TABLE products (id INTEGER PRIMARY KEY, name VARCHAR NOT NULL, price DECIMAL(10, 2), note VARCHAR)"));

    const auto insert = target.Query("INSERT INTO products VALUES ($id, $name, $price, $note)");
    (void)sql::ExecuteNonQuery(insert.Parameters(
        {{"id", sql::Integer(1)}, {"name", sql::VarChar("widget")}, {"price", sql::Decimal("9.99")}, {"note", sql::kNull}}));
    (void)sql::ExecuteNonQuery(insert.Parameters({{"id", sql::Integer(2)},
                                                  {"name", sql::VarChar("gadget")},
                                                  {"price", sql::Decimal("24.50")},
                                                  {"note", sql::VarChar("limited")}}));

    const auto products = sql::Execute(target.Query("SELECT * FROM products ORDER BY id"), ReadProduct);
    for (const auto& p : products) {
      std::cout << p.id << ' ' << p.name << ' ' << p.price.ToString() << ' ' << p.note.value_or("-") << '\n';
    }

    const auto cheapest = sql::ExecuteRow(
        target.Query("SELECT * FROM products WHERE price < $max ORDER BY price").Parameters({{"max", sql::Decimal("10")}}),
        ReadProduct);
    std::cout << "cheapest: " << cheapest.name << '\n';

    // Lazy: the query runs when the loop starts.
    for (const auto& name : sql::ToSeq(target.Query("SELECT name FROM products"),
                                       [](sql::RowReader& row) { return row.String("name"); })) {
      std::cout << "name: " << name << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "quickstart failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
