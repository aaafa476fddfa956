#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ducksql::model {

/*
  Exact decimal: unscaled 128-bit integer + scale.

  Holds up to 38 significant digits, the widest DECIMAL the engine stores.
  Equality compares numeric value, so 1.50 == 1.5.
*/
class Decimal {
 public:
  __extension__ using Unscaled = __int128;

  static constexpr int kMaxPrecision = 38;

  Decimal() = default;
  explicit Decimal(std::int64_t value) : unscaled_(value) {
  }
  Decimal(Unscaled unscaled, std::uint8_t scale);

  // "-123.4500", "42", ".5"; no exponent form.
  static Decimal Parse(std::string_view text);

  Unscaled Value() const {
    return unscaled_;
  }
  std::uint8_t Scale() const {
    return scale_;
  }

  // Number of significant digits in the unscaled value (at least 1).
  int Precision() const;

  // Same value at the given scale. Throws std::overflow_error when digits would be lost
  // or the result exceeds kMaxPrecision.
  Decimal Rescale(std::uint8_t scale) const;

  // Trailing fractional zeros removed.
  Decimal Normalized() const;

  double      ToDouble() const;
  std::string ToString() const;

  bool operator==(const Decimal& other) const;

 private:
  Unscaled     unscaled_ = 0;
  std::uint8_t scale_    = 0;
};

} // namespace ducksql::model
