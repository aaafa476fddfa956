#include "uuid.hpp"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace ducksql::model {

Uuid Uuid::Generate() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  Uuid id;
  for (auto& b : id.bytes)
    b = static_cast<std::uint8_t>(rng());

  // RFC4122 variant + version 4
  id.bytes[6] = (id.bytes[6] & 0x0F) | 0x40;
  id.bytes[8] = (id.bytes[8] & 0x3F) | 0x80;

  return id;
}

std::string Uuid::ToString() const {
  std::ostringstream oss;

  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

Uuid Uuid::Parse(const std::string& text) {
  std::string hex;
  for (char c : text) {
    if (c == '-' || c == '{' || c == '}') continue;
    if (!std::isxdigit(static_cast<unsigned char>(c)))
      throw std::invalid_argument("Invalid UUID string: " + text);
    hex += c;
  }

  if (hex.size() != 32)
    throw std::invalid_argument("Invalid UUID string: " + text);

  Uuid id;
  for (size_t i = 0; i < 16; ++i)
    id.bytes[i] = static_cast<std::uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));

  return id;
}

} // namespace ducksql::model
