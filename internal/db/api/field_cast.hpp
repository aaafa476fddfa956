#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "internal/db/api/value.hpp"
#include "internal/util/errors.hpp"

namespace ducksql::db {

/*
  Typed extraction of a cell value.

  Integers widen and narrow with a range check; everything else must match
  the stored alternative. NULL satisfies only std::optional targets, and
  list elements follow the same rule.
*/

namespace detail {

template <typename T>
struct IsOptional : std::false_type {};
template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T>
struct IsVector : std::false_type {};
template <typename T>
struct IsVector<std::vector<T>> : std::true_type {};

template <typename T>
constexpr bool kIsSignedInt = std::is_integral_v<T> && std::is_signed_v<T> && !std::is_same_v<T, bool>;

template <typename T>
std::string TargetName() {
  if constexpr (std::is_same_v<T, bool>) return "BOOLEAN";
  else if constexpr (std::is_same_v<T, std::int8_t>) return "TINYINT";
  else if constexpr (std::is_same_v<T, std::int16_t>) return "SMALLINT";
  else if constexpr (std::is_same_v<T, std::int32_t>) return "INTEGER";
  else if constexpr (std::is_same_v<T, std::int64_t>) return "BIGINT";
  else if constexpr (std::is_same_v<T, float>) return "FLOAT";
  else if constexpr (std::is_same_v<T, double>) return "DOUBLE";
  else if constexpr (std::is_same_v<T, model::Decimal>) return "DECIMAL";
  else if constexpr (std::is_same_v<T, std::string>) return "VARCHAR";
  else if constexpr (std::is_same_v<T, model::Bytes>) return "BLOB";
  else if constexpr (std::is_same_v<T, model::Uuid>) return "UUID";
  else if constexpr (std::is_same_v<T, model::Date>) return "DATE";
  else if constexpr (std::is_same_v<T, model::TimeOfDay>) return "TIME";
  else if constexpr (std::is_same_v<T, model::TimeTz>) return "TIME WITH TIME ZONE";
  else if constexpr (std::is_same_v<T, model::Timestamp>) return "TIMESTAMP";
  else if constexpr (std::is_same_v<T, model::TimestampTz> || std::is_same_v<T, model::DateTimeOffset>)
    return "TIMESTAMP WITH TIME ZONE";
  else if constexpr (std::is_same_v<T, model::Interval>) return "INTERVAL";
  else if constexpr (IsOptional<T>::value) return TargetName<typename T::value_type>();
  else if constexpr (IsVector<T>::value) return TargetName<typename T::value_type>() + "[]";
  else return "VALUE";
}

[[noreturn]] inline void ThrowCast(const Value& value, const std::string& target) {
  if (value.IsNull()) {
    throw util::InvalidCast("Cannot read NULL as " + target);
  }
  throw util::InvalidCast("Unable to cast " + std::string(value.TypeName()) + " value to " + target);
}

template <typename T>
T CastInteger(const Value& value) {
  return std::visit(
      [&](const auto& v) -> T {
        using S = std::decay_t<decltype(v)>;
        if constexpr (kIsSignedInt<S>) {
          if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) {
            throw util::InvalidCast("Value " + std::to_string(v) + " is out of range for " + TargetName<T>());
          }
          return static_cast<T>(v);
        } else {
          ThrowCast(value, TargetName<T>());
        }
      },
      value.Get());
}

template <typename T>
T CastFloating(const Value& value) {
  return std::visit(
      [&](const auto& v) -> T {
        using S = std::decay_t<decltype(v)>;
        if constexpr (kIsSignedInt<S> || std::is_floating_point_v<S>) {
          return static_cast<T>(v);
        } else if constexpr (std::is_same_v<S, model::Decimal>) {
          return static_cast<T>(v.ToDouble());
        } else {
          ThrowCast(value, TargetName<T>());
        }
      },
      value.Get());
}

} // namespace detail

template <typename T>
T FieldCast(const Value& value) {
  if constexpr (detail::IsOptional<T>::value) {
    if (value.IsNull()) return std::nullopt;
    return FieldCast<typename T::value_type>(value);
  } else if constexpr (detail::IsVector<T>::value && !std::is_same_v<T, model::Bytes>) {
    const auto* list = value.GetIf<ValueList>();
    if (list == nullptr) detail::ThrowCast(value, detail::TargetName<T>());
    T out;
    out.reserve(list->items.size());
    for (const auto& item : list->items) {
      out.push_back(FieldCast<typename T::value_type>(item));
    }
    return out;
  } else if constexpr (detail::kIsSignedInt<T>) {
    return detail::CastInteger<T>(value);
  } else if constexpr (std::is_floating_point_v<T>) {
    return detail::CastFloating<T>(value);
  } else if constexpr (std::is_same_v<T, model::Decimal>) {
    if (const auto* d = value.GetIf<model::Decimal>()) return *d;
    if (const auto* i = value.GetIf<std::int64_t>()) return model::Decimal(*i);
    if (const auto* i = value.GetIf<std::int32_t>()) return model::Decimal(std::int64_t{*i});
    if (const auto* i = value.GetIf<std::int16_t>()) return model::Decimal(std::int64_t{*i});
    if (const auto* i = value.GetIf<std::int8_t>()) return model::Decimal(std::int64_t{*i});
    detail::ThrowCast(value, detail::TargetName<T>());
  } else if constexpr (std::is_same_v<T, model::DateTimeOffset>) {
    if (const auto* ts = value.GetIf<model::TimestampTz>()) {
      return model::DateTimeOffset{model::Timestamp{ts->time_since_epoch()}, std::chrono::seconds{0}};
    }
    detail::ThrowCast(value, detail::TargetName<T>());
  } else {
    if (const auto* v = value.GetIf<T>()) return *v;
    detail::ThrowCast(value, detail::TargetName<T>());
  }
}

} // namespace ducksql::db
