#include "internal/db/duckdb/duckdb_database_cache.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"

namespace ducksql::db::duck {
namespace {

std::string FileKey(const ConnectionStringBuilder& builder) {
  std::error_code ec;
  auto            path = std::filesystem::absolute(builder.DatabasePath(), ec);
  std::string     key  = ec ? builder.DatabasePath() : path.lexically_normal().string();
  for (const auto& [k, v] : builder.GetOptions()) {
    key += ";" + k + "=" + v;
  }
  return key;
}

} // namespace

DatabaseCache& DatabaseCache::Instance() {
  static DatabaseCache cache;
  return cache;
}

std::shared_ptr<::duckdb::DuckDB> DatabaseCache::Create(const ConnectionStringBuilder& builder) {
  ::duckdb::DBConfig config;
  for (const auto& [key, value] : builder.GetOptions()) {
    config.SetOptionByName(key, ::duckdb::Value(value));
  }

  const auto path = builder.DatabasePath();
  DUCKSQL_LOG_DEBUG("opening duckdb instance",
                    {observability::StringField("source", builder.Source()),
                     observability::BoolField("read_only", builder.IsReadOnly())});

  if (path.empty()) {
    return std::make_shared<::duckdb::DuckDB>(static_cast<const char*>(nullptr), &config);
  }
  return std::make_shared<::duckdb::DuckDB>(path, &config);
}

std::shared_ptr<::duckdb::DuckDB> DatabaseCache::Acquire(const ConnectionStringBuilder& builder) {
  if (builder.IsInMemory() && !builder.IsSharedCache()) {
    return Create(builder);
  }

  std::scoped_lock lock(mutex_);

  if (builder.IsInMemory()) {
    const auto key = builder.Source();
    auto       it  = shared_.find(key);
    if (it != shared_.end()) {
      return it->second;
    }
    auto db = Create(builder);
    shared_.emplace(key, db);
    DUCKSQL_LOG_INFO("shared in-memory database created", {observability::StringField("source", key)});
    return db;
  }

  const auto key = FileKey(builder);
  if (auto it = files_.find(key); it != files_.end()) {
    if (auto db = it->second.lock()) {
      return db;
    }
  }
  std::erase_if(files_, [](const auto& entry) { return entry.second.expired(); });
  auto db     = Create(builder);
  files_[key] = db;
  return db;
}

bool DatabaseCache::Evict(const std::string& source) {
  std::scoped_lock lock(mutex_);
  const bool       erased = shared_.erase(source) > 0;
  if (erased) {
    DUCKSQL_LOG_INFO("shared in-memory database evicted", {observability::StringField("source", source)});
  }
  return erased;
}

std::size_t DatabaseCache::SharedCount() const {
  std::scoped_lock lock(mutex_);
  return shared_.size();
}

} // namespace ducksql::db::duck
