#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/core/sql_props.hpp"

namespace {

using ducksql::config::ConfigLoader;
namespace sql = ducksql::sql;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ducksql_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFileTargetAndEngineOptions() {
  const auto yaml_path = WriteYaml("file_target",
                                   R"(logging:
  level: debug
target:
  file:
    path: "/var/lib/app/orders.duckdb"
    read_only: true
engine:
  options:
    threads: "4"
    memory_limit: "1GB"
execution:
  prepare: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.target().has_file());
  assert(config.target().file().path() == "/var/lib/app/orders.duckdb");
  assert(config.target().file().read_only());
  assert(config.engine().options().at("threads") == "4");
  assert(config.execution().prepare());

  const auto props = sql::FromConfig(config);
  assert(props.NeedPrepare());
  // options are appended in key order
  assert(sql::ConnectionStringFor(props.Target()) ==
         "Data Source=/var/lib/app/orders.duckdb;ACCESS_MODE=READ_ONLY;memory_limit=1GB;threads=4");
}

void TestMemoryTargetWithoutOptions() {
  auto config = ConfigLoader::LoadFromYamlString(R"(target:
  memory:
    name: cache
    shared: true
)");

  const auto props = sql::FromConfig(config);
  assert(std::holds_alternative<sql::MemoryTarget>(props.Target()));
  assert(sql::ConnectionStringFor(props.Target()) == "Data Source=:memory:cache?cache=shared");
  assert(!props.NeedPrepare());
}

void TestEmptyConfigKeepsDefaults() {
  auto       config = ConfigLoader::LoadFromYamlString("logging:\n  level: info\n");
  const auto props  = sql::FromConfig(config);
  assert(std::holds_alternative<sql::MemoryTarget>(props.Target()));
  assert(std::get<sql::MemoryTarget>(props.Target()).name == "default");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(target:
  file:
    path: "C:\\data\\\"quoted\"\\db.duckdb"
    read_only: false
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.target().file().path() == "C:\\data\\\"quoted\"\\db.duckdb");
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(target:
  memory:
    name: "2024"
    shared: false
)");
  assert(config.target().memory().name() == "2024");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::LoadFromYamlString(R"(target:
  connection_string: "Data Source=line1\nline2☃"
)");
  assert(config.target().connection_string() == std::string("Data Source=line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(target:
  memory:
    name: x
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/ducksql/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).rfind("Failed to load YAML config", 0) == 0;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFileTargetAndEngineOptions();
  TestMemoryTargetWithoutOptions();
  TestEmptyConfigKeepsDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "ducksql_unit_config_loader: pass\n";
  return 0;
}
