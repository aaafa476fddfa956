#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"

namespace {

using ducksql::config::ConfigLoader;
namespace observability = ducksql::observability;

void TestConfiguredLevelFiltersDebug() {
  ::unsetenv("DUCKSQL_LOG_LEVEL");
  observability::InitializeLogging(ConfigLoader::LoadFromYamlString("logging:\n  level: warn\n"));

  assert(!observability::IsEnabled(spdlog::level::debug));
  assert(!observability::IsEnabled(spdlog::level::info));
  assert(observability::IsEnabled(spdlog::level::warn));

  // suppressed levels are dropped quietly
  DUCKSQL_LOG_DEBUG("parameter not referenced by statement", {observability::StringField("name", "x")});
}

void TestEnvironmentOverridesConfig() {
  ::setenv("DUCKSQL_LOG_LEVEL", "debug", 1);
  observability::InitializeLogging(ConfigLoader::LoadFromYamlString("logging:\n  level: error\n"));

  assert(observability::IsEnabled(spdlog::level::debug));
  DUCKSQL_LOG_INFO("shared in-memory database created",
                   {observability::StringField("source", ":memory:logs"), observability::BoolField("read_only", false)});

  ::unsetenv("DUCKSQL_LOG_LEVEL");
}

void TestFieldsRenderAsText() {
  const auto flag = observability::BoolField("read_only", true);
  assert(flag.key == "read_only");
  assert(flag.value == "true");
  assert(observability::StringField("source", "a.duckdb").value == "a.duckdb");
}

} // namespace

int main() {
  TestConfiguredLevelFiltersDebug();
  TestEnvironmentOverridesConfig();
  TestFieldsRenderAsText();
  observability::ShutdownLogging();

  std::cout << "ducksql_unit_logging: pass\n";
  return 0;
}
