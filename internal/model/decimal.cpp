#include "decimal.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace ducksql::model {
namespace {

using Unscaled = Decimal::Unscaled;

Unscaled Abs(Unscaled v) {
  return v < 0 ? -v : v;
}

int CountDigits(Unscaled v) {
  v     = Abs(v);
  int n = 1;
  while (v >= 10) {
    v /= 10;
    ++n;
  }
  return n;
}

} // namespace

Decimal::Decimal(Unscaled unscaled, std::uint8_t scale) : unscaled_(unscaled), scale_(scale) {
  if (scale_ > kMaxPrecision) {
    throw std::invalid_argument("Decimal scale exceeds " + std::to_string(kMaxPrecision));
  }
  if (CountDigits(unscaled_) > kMaxPrecision) {
    throw std::overflow_error("Decimal precision exceeds " + std::to_string(kMaxPrecision) + " digits");
  }
}

Decimal Decimal::Parse(std::string_view text) {
  const std::string original(text);

  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    text.remove_suffix(1);

  bool negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  Unscaled     unscaled   = 0;
  std::uint8_t scale      = 0;
  int          digits     = 0;
  bool         seen_point = false;
  bool         seen_digit = false;

  for (char c : text) {
    if (c == '.') {
      if (seen_point) throw std::invalid_argument("Invalid decimal: " + original);
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') throw std::invalid_argument("Invalid decimal: " + original);

    seen_digit = true;
    if (unscaled != 0 || c != '0') ++digits;
    if (digits > kMaxPrecision) throw std::overflow_error("Decimal precision exceeds 38 digits: " + original);

    unscaled = unscaled * 10 + (c - '0');
    if (seen_point) ++scale;
  }

  if (!seen_digit) throw std::invalid_argument("Invalid decimal: " + original);
  if (scale > kMaxPrecision) throw std::overflow_error("Decimal scale exceeds 38: " + original);

  return Decimal(negative ? -unscaled : unscaled, scale);
}

int Decimal::Precision() const {
  return CountDigits(unscaled_);
}

Decimal Decimal::Rescale(std::uint8_t scale) const {
  Unscaled v = unscaled_;
  if (scale >= scale_) {
    for (int i = scale_; i < scale; ++i) {
      if (CountDigits(v) >= kMaxPrecision && v != 0) throw std::overflow_error("Decimal rescale overflows " + ToString());
      v *= 10;
    }
  } else {
    for (int i = scale; i < scale_; ++i) {
      if (v % 10 != 0) throw std::overflow_error("Decimal rescale loses digits of " + ToString());
      v /= 10;
    }
  }
  return Decimal(v, scale);
}

Decimal Decimal::Normalized() const {
  Decimal out = *this;
  while (out.scale_ > 0 && out.unscaled_ % 10 == 0) {
    out.unscaled_ /= 10;
    --out.scale_;
  }
  return out;
}

double Decimal::ToDouble() const {
  return static_cast<double>(unscaled_) / std::pow(10.0, scale_);
}

std::string Decimal::ToString() const {
  std::string digits;
  Unscaled    v = Abs(unscaled_);
  do {
    digits.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
    v /= 10;
  } while (v != 0);

  while (digits.size() <= scale_)
    digits.push_back('0');

  std::reverse(digits.begin(), digits.end());
  if (scale_ > 0) digits.insert(digits.end() - scale_, '.');
  if (unscaled_ < 0) digits.insert(digits.begin(), '-');
  return digits;
}

bool Decimal::operator==(const Decimal& other) const {
  const auto a = Normalized();
  const auto b = other.Normalized();
  return a.unscaled_ == b.unscaled_ && a.scale_ == b.scale_;
}

} // namespace ducksql::model
