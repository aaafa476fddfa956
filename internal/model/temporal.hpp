#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace ducksql::model {

/*
  Host representations of the engine's temporal types.

  All sub-second values are microseconds, the engine's native resolution.

    DATE         -> Date          (days since 1970-01-01)
    TIME         -> TimeOfDay     (microseconds since midnight)
    TIMETZ       -> TimeTz        (time of day + UTC offset, no date)
    TIMESTAMP    -> Timestamp     (naive wall clock)
    TIMESTAMPTZ  -> TimestampTz   (instant, UTC)
    INTERVAL     -> Interval      (months / days / micros kept apart)
*/

using Date        = std::chrono::sys_days;
using TimeOfDay   = std::chrono::microseconds;
using Timestamp   = std::chrono::local_time<std::chrono::microseconds>;
using TimestampTz = std::chrono::sys_time<std::chrono::microseconds>;

struct TimeTz {
  TimeOfDay            time{0};
  std::chrono::seconds offset{0};

  // Time of day in UTC, wrapped into [00:00, 24:00).
  TimeOfDay UtcTime() const;

  // "12:34:56.123456+05:30" as the engine renders it.
  static TimeTz Parse(std::string_view text);

  bool operator==(const TimeTz&) const = default;
};

/*
  Wall clock time with the offset it was observed at.
*/
struct DateTimeOffset {
  Timestamp            local{};
  std::chrono::seconds offset{0};

  TimestampTz UtcTime() const {
    return TimestampTz{local.time_since_epoch() - offset};
  }

  bool operator==(const DateTimeOffset&) const = default;
};

struct Interval {
  std::int32_t months = 0;
  std::int32_t days   = 0;
  std::int64_t micros = 0;

  // Splits whole days out of the duration; months stays 0.
  static Interval FromDuration(std::chrono::microseconds duration);

  // Months count as 30 days.
  std::chrono::microseconds ToDuration() const;

  bool operator==(const Interval&) const = default;
};

Date FloorToDate(Timestamp ts);

// Naive value read as UTC.
TimestampTz AssumeUtc(Timestamp ts);

std::string ToString(TimeOfDay time);
std::string ToString(const TimeTz& time);

} // namespace ducksql::model
