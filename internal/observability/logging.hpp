#pragma once

#include <spdlog/common.h>

#include <initializer_list>
#include <string>
#include <string_view>

namespace ducksql::runtime::config {
class RuntimeConfig;
}

namespace ducksql::observability {

/*
  Structured log lines: "<message> key=value key=value".

  The library logs database lifecycle at info/debug and rollbacks at warn;
  nothing is logged on the per-row path.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField BoolField(std::string_view key, bool value);

// Installs the "ducksql" logger. Until called, messages go to spdlog's default logger.
void InitializeLogging(const ducksql::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Lets hot paths skip building fields for a suppressed level.
bool IsEnabled(spdlog::level::level_enum level);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

} // namespace ducksql::observability

#define DUCKSQL_LOG_DEBUG(message, ...) ::ducksql::observability::LogDebug((message), ##__VA_ARGS__)
#define DUCKSQL_LOG_INFO(message, ...) ::ducksql::observability::LogInfo((message), ##__VA_ARGS__)
#define DUCKSQL_LOG_WARN(message, ...) ::ducksql::observability::LogWarn((message), ##__VA_ARGS__)
