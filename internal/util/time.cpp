#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <cstdio>

#include "internal/util/errors.hpp"

namespace tracksync::util {

using google::protobuf::util::TimeUtil;

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Duration>(std::chrono::seconds(ts.seconds()) +
                                                             std::chrono::nanoseconds(ts.nanos()));
}

std::string ToRfc3339(TimePoint tp) {
  return TimeUtil::ToString(ToProto(tp));
}

TimePoint FromRfc3339(const std::string& text) {
  google::protobuf::Timestamp ts;
  if (!TimeUtil::FromString(text, &ts)) {
    throw ValidationError("invalid timestamp: " + text);
  }
  return FromProto(ts);
}

std::string FormatDateTime(TimePoint tp) {
  // whole seconds only; the fraction never matters in reports
  auto text = ToRfc3339(std::chrono::floor<std::chrono::seconds>(tp));
  return text.substr(0, 10) + " " + text.substr(11, 8);
}

std::string FormatTimeOfDay(TimePoint tp) {
  return FormatDateTime(tp).substr(11);
}

bool SameDate(TimePoint a, TimePoint b) {
  return std::chrono::floor<std::chrono::days>(a) == std::chrono::floor<std::chrono::days>(b);
}

std::string FormatDuration(Duration d) {
  const bool negative = d < Duration::zero();
  auto       total    = std::chrono::duration_cast<std::chrono::seconds>(negative ? -d : d).count();

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s%lld:%02lld:%02lld", negative ? "-" : "", static_cast<long long>(total / 3600),
                static_cast<long long>((total / 60) % 60), static_cast<long long>(total % 60));
  return buf;
}

} // namespace tracksync::util
