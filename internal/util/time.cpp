#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <stdexcept>

namespace entitlement::util {

TimePoint Now() {
  return std::chrono::floor<std::chrono::microseconds>(Clock::now());
}

bool IsValidTimestamp(const google::protobuf::Timestamp& ts) {
  return ts.seconds() >= kMinTimestampSeconds && ts.seconds() <= kMaxTimestampSeconds && ts.nanos() >= 0 && ts.nanos() <= 999'999'999;
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec    = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch());
  auto micros = tp.time_since_epoch() - sec;

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.count());
  ts.set_nanos(static_cast<int32_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(micros).count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  if (!IsValidTimestamp(ts)) {
    throw std::out_of_range("timestamp out of range: seconds=" + std::to_string(ts.seconds()) + " nanos=" + std::to_string(ts.nanos()));
  }
  return TimePoint{} + std::chrono::seconds(ts.seconds()) + std::chrono::microseconds(ts.nanos() / 1000);
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::string FormatRfc3339(TimePoint tp) {
  return google::protobuf::util::TimeUtil::ToString(ToProto(tp));
}

std::optional<TimePoint> ParseRfc3339(const std::string& text) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(text, &ts) || !IsValidTimestamp(ts)) {
    return std::nullopt;
  }
  return FromProto(ts);
}

} // namespace entitlement::util
