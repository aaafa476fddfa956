#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/db/api/blob_stream.hpp"
#include "internal/db/api/types.hpp"
#include "internal/model/bytes.hpp"
#include "internal/model/decimal.hpp"
#include "internal/model/temporal.hpp"
#include "internal/model/uuid.hpp"

namespace ducksql::db {

class Value;

/*
  Homogeneous list. The element type travels with the items so that an empty
  list, or a list of NULLs, still has a concrete engine type.
*/
struct ValueList {
  DbType             element_type = DbType::kVarChar;
  std::vector<Value> items;

  bool operator==(const ValueList& other) const;
};

/*
  Engine-neutral cell / parameter value.

  monostate is SQL NULL. BLOB cells read from a cursor arrive as a BlobStream,
  BLOB parameters are bound as Bytes.
*/
class Value {
 public:
  using Storage = std::variant<std::monostate,
                               bool,
                               std::int8_t,
                               std::int16_t,
                               std::int32_t,
                               std::int64_t,
                               float,
                               double,
                               model::Decimal,
                               std::string,
                               model::Bytes,
                               std::shared_ptr<BlobStream>,
                               model::Uuid,
                               model::Date,
                               model::TimeOfDay,
                               model::TimeTz,
                               model::Timestamp,
                               model::TimestampTz,
                               model::Interval,
                               ValueList>;

  Value() = default;

  template <typename T>
    requires std::constructible_from<Storage, T&&> && (!std::same_as<std::remove_cvref_t<T>, Value>)
  Value(T&& value) : storage_(std::forward<T>(value)) {
  }

  Value(const char* text) : storage_(std::string(text)) {
  }

  bool IsNull() const {
    return std::holds_alternative<std::monostate>(storage_);
  }

  const Storage& Get() const {
    return storage_;
  }

  template <typename T>
  const T* GetIf() const {
    return std::get_if<T>(&storage_);
  }

  // Engine spelling of the held alternative, "NULL" for monostate.
  std::string_view TypeName() const;

  bool operator==(const Value& other) const {
    return storage_ == other.storage_;
  }

 private:
  Storage storage_;
};

} // namespace ducksql::db
