#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace ducksql::model {

/*
  RFC4122 UUID stored as raw 16 bytes, big-endian as printed.
*/
struct Uuid {
  std::array<std::uint8_t, 16> bytes{};

  static Uuid Generate();

  // Accepts the canonical 8-4-4-4-12 form and the undashed 32 hex digit form.
  static Uuid Parse(const std::string& text);

  std::string ToString() const;

  bool operator==(const Uuid&) const = default;
};

} // namespace ducksql::model
