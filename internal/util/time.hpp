#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace entitlement::util {

/*
  Time utilities. Single place to control the clock source.

  TimePoint is kept at microsecond resolution: system_clock's native
  nanoseconds only reach year 2262, while a google.protobuf.Timestamp may
  name any instant in years 0001-9999.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

// Injectable wall clock. Production code passes Now.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

// Range of a valid google.protobuf.Timestamp.
inline constexpr std::int64_t kMinTimestampSeconds = -62135596800;  // 0001-01-01T00:00:00Z
inline constexpr std::int64_t kMaxTimestampSeconds = 253402300799;  // 9999-12-31T23:59:59Z

bool IsValidTimestamp(const google::protobuf::Timestamp& ts);

google::protobuf::Timestamp ToProto(TimePoint tp);

// Sub-microsecond nanos are truncated. Throws std::out_of_range for a
// timestamp outside the protobuf-defined range.
TimePoint FromProto(const google::protobuf::Timestamp& ts);

int64_t ToUnixSeconds(TimePoint tp);

// RFC 3339, e.g. "2026-10-19T12:00:00Z".
std::string              FormatRfc3339(TimePoint tp);
std::optional<TimePoint> ParseRfc3339(const std::string& text);

} // namespace entitlement::util
