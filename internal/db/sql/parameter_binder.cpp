#include "internal/db/sql/parameter_binder.hpp"

#include <cctype>
#include <type_traits>

namespace ducksql::sql {
namespace {

template <typename T>
constexpr db::DbType ElementType() {
  if constexpr (std::is_same_v<T, std::optional<std::string>>) return db::DbType::kVarChar;
  else if constexpr (std::is_same_v<T, std::int16_t>) return db::DbType::kSmallInt;
  else if constexpr (std::is_same_v<T, std::int32_t>) return db::DbType::kInteger;
  else if constexpr (std::is_same_v<T, std::int64_t>) return db::DbType::kBigInt;
  else if constexpr (std::is_same_v<T, double>) return db::DbType::kDouble;
  else if constexpr (std::is_same_v<T, model::Decimal>) return db::DbType::kDecimal;
  else if constexpr (std::is_same_v<T, model::Uuid>) return db::DbType::kUuid;
  else static_assert(!sizeof(T), "unsupported list element");
}

template <typename T>
db::Value EraseElement(const T& item) {
  if constexpr (std::is_same_v<T, std::optional<std::string>>) {
    return item ? db::Value(*item) : db::Value();
  } else {
    return db::Value(item);
  }
}

template <typename T>
db::Value Erase(const T& payload) {
  return db::Value(payload);
}

template <typename T>
db::Value Erase(const std::vector<T>& items) {
  db::ValueList list;
  list.element_type = ElementType<T>();
  list.items.reserve(items.size());
  for (const auto& item : items) {
    list.items.push_back(EraseElement(item));
  }
  return list;
}

db::Value Erase(const model::Bytes& bytes) {
  return db::Value(bytes);
}

} // namespace

std::string NormalizeParameterName(std::string_view name) {
  while (!name.empty() && std::isspace(static_cast<unsigned char>(name.front())))
    name.remove_prefix(1);
  while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back())))
    name.remove_suffix(1);
  while (!name.empty() && (name.front() == '$' || name.front() == '@'))
    name.remove_prefix(1);
  return std::string(name);
}

db::Parameter ToParameter(std::string_view name, const SqlValue& value) {
  auto normalized = NormalizeParameterName(name);

  return std::visit(
      [&](const auto& v) -> db::Parameter {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, value::Null>) {
          return db::Parameter{std::move(normalized), db::Value(), std::nullopt};
        } else if constexpr (std::is_same_v<V, value::Raw>) {
          auto parameter = v.parameter;
          parameter.name = std::move(normalized);
          return parameter;
        } else {
          return db::Parameter{std::move(normalized), Erase(v.value), std::nullopt};
        }
      },
      value);
}

void BindParameters(db::Command& command, const SqlParameters& parameters) {
  auto& collection = command.Parameters();
  for (const auto& [name, value] : parameters) {
    collection.push_back(ToParameter(name, value));
  }
}

} // namespace ducksql::sql
