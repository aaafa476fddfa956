#include "internal/db/duckdb/connection_string.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ducksql::db::duck {
namespace {

constexpr std::string_view kMemory      = ":memory:";
constexpr std::string_view kSharedCache = "?cache=shared";
constexpr std::string_view kAccessMode  = "ACCESS_MODE";

std::string Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return std::string(s);
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

ConnectionStringBuilder ConnectionStringBuilder::Parse(std::string_view connection_string) {
  ConnectionStringBuilder builder;

  size_t start = 0;
  while (start <= connection_string.size()) {
    auto end = connection_string.find(';', start);
    if (end == std::string_view::npos) end = connection_string.size();

    const auto part = Trim(connection_string.substr(start, end - start));
    start           = end + 1;
    if (part.empty()) continue;

    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      throw std::invalid_argument("Invalid connection string segment '" + part + "': expected key=value");
    }

    auto key   = Trim(std::string_view(part).substr(0, eq));
    auto value = Trim(std::string_view(part).substr(eq + 1));

    if (EqualsIgnoreCase(key, "Data Source") || EqualsIgnoreCase(key, "DataSource")) {
      builder.data_source_ = std::move(value);
    } else {
      builder.SetOption(std::move(key), std::move(value));
    }
  }

  return builder;
}

ConnectionStringBuilder& ConnectionStringBuilder::SetDataSource(std::string data_source) {
  data_source_ = std::move(data_source);
  return *this;
}

ConnectionStringBuilder& ConnectionStringBuilder::SetOption(std::string key, std::string value) {
  for (auto& [k, v] : options_) {
    if (EqualsIgnoreCase(k, key)) {
      v = std::move(value);
      return *this;
    }
  }
  options_.emplace_back(std::move(key), std::move(value));
  return *this;
}

ConnectionStringBuilder& ConnectionStringBuilder::SetReadOnly(bool read_only) {
  if (read_only) {
    return SetOption(std::string(kAccessMode), "READ_ONLY");
  }
  options_.erase(std::remove_if(options_.begin(), options_.end(),
                                [](const auto& option) { return EqualsIgnoreCase(option.first, kAccessMode); }),
                 options_.end());
  return *this;
}

bool ConnectionStringBuilder::IsReadOnly() const {
  for (const auto& [k, v] : options_) {
    if (EqualsIgnoreCase(k, kAccessMode)) return EqualsIgnoreCase(v, "READ_ONLY");
  }
  return false;
}

bool ConnectionStringBuilder::IsInMemory() const {
  return data_source_.empty() || data_source_.rfind(kMemory, 0) == 0;
}

bool ConnectionStringBuilder::IsSharedCache() const {
  return EndsWith(data_source_, kSharedCache);
}

std::string ConnectionStringBuilder::Source() const {
  if (IsSharedCache()) return data_source_.substr(0, data_source_.size() - kSharedCache.size());
  return data_source_.empty() ? std::string(kMemory) : data_source_;
}

std::string ConnectionStringBuilder::DatabasePath() const {
  return IsInMemory() ? std::string() : Source();
}

std::string ConnectionStringBuilder::ToString() const {
  std::string out = "Data Source=" + data_source_;
  for (const auto& [k, v] : options_) {
    out += ";" + k + "=" + v;
  }
  return out;
}

} // namespace ducksql::db::duck
