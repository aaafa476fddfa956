#include "temporal.hpp"

#include <cstdio>
#include <stdexcept>

namespace ducksql::model {
namespace {

constexpr std::int64_t kMicrosPerDay = std::int64_t{86'400} * 1'000'000;

int ParseFixed(std::string_view text, size_t pos, size_t count, std::string_view original) {
  if (pos + count > text.size()) throw std::invalid_argument("Invalid TIMETZ value: " + std::string(original));
  int value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') throw std::invalid_argument("Invalid TIMETZ value: " + std::string(original));
    value = value * 10 + (c - '0');
  }
  return value;
}

} // namespace

TimeOfDay TimeTz::UtcTime() const {
  auto utc = (time - std::chrono::duration_cast<TimeOfDay>(offset)).count() % kMicrosPerDay;
  if (utc < 0) utc += kMicrosPerDay;
  return TimeOfDay{utc};
}

TimeTz TimeTz::Parse(std::string_view text) {
  // HH:MM:SS[.ffffff](+|-)HH[:MM[:SS]]
  const auto sign_pos = text.find_first_of("+-", 8);
  if (sign_pos == std::string_view::npos) throw std::invalid_argument("Invalid TIMETZ value: " + std::string(text));

  const auto clock  = text.substr(0, sign_pos);
  const auto offset = text.substr(sign_pos + 1);

  const int hours   = ParseFixed(clock, 0, 2, text);
  const int minutes = ParseFixed(clock, 3, 2, text);
  const int seconds = ParseFixed(clock, 6, 2, text);

  std::int64_t micros = 0;
  if (clock.size() > 8) {
    if (clock[8] != '.') throw std::invalid_argument("Invalid TIMETZ value: " + std::string(text));
    const auto fraction = clock.substr(9);
    if (fraction.empty() || fraction.size() > 6) throw std::invalid_argument("Invalid TIMETZ value: " + std::string(text));
    micros = ParseFixed(fraction, 0, fraction.size(), text);
    for (size_t i = fraction.size(); i < 6; ++i)
      micros *= 10;
  }

  int offset_seconds = ParseFixed(offset, 0, 2, text) * 3600;
  if (offset.size() >= 5) offset_seconds += ParseFixed(offset, 3, 2, text) * 60;
  if (offset.size() >= 8) offset_seconds += ParseFixed(offset, 6, 2, text);
  if (text[sign_pos] == '-') offset_seconds = -offset_seconds;

  TimeTz out;
  out.time   = std::chrono::hours{hours} + std::chrono::minutes{minutes} + std::chrono::seconds{seconds} +
             TimeOfDay{micros};
  out.offset = std::chrono::seconds{offset_seconds};
  return out;
}

Interval Interval::FromDuration(std::chrono::microseconds duration) {
  Interval out;
  out.days   = static_cast<std::int32_t>(duration.count() / kMicrosPerDay);
  out.micros = duration.count() % kMicrosPerDay;
  return out;
}

std::chrono::microseconds Interval::ToDuration() const {
  return std::chrono::microseconds{(std::int64_t{months} * 30 + days) * kMicrosPerDay + micros};
}

Date FloorToDate(Timestamp ts) {
  return Date{std::chrono::floor<std::chrono::days>(ts).time_since_epoch()};
}

TimestampTz AssumeUtc(Timestamp ts) {
  return TimestampTz{ts.time_since_epoch()};
}

std::string ToString(TimeOfDay time) {
  const auto total = time.count();
  char       buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%06lld", static_cast<long long>(total / 3'600'000'000LL),
                static_cast<long long>(total / 60'000'000LL % 60), static_cast<long long>(total / 1'000'000LL % 60),
                static_cast<long long>(total % 1'000'000LL));
  return buf;
}

std::string ToString(const TimeTz& time) {
  auto       secs = time.offset.count();
  const char sign = secs < 0 ? '-' : '+';
  if (secs < 0) secs = -secs;
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%c%02lld:%02lld", sign, static_cast<long long>(secs / 3600),
                static_cast<long long>(secs / 60 % 60));
  return ToString(time.time) + buf;
}

} // namespace ducksql::model
