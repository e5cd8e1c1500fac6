#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace tracksync::util {

/*
  Time utilities: single place to control clock source and the
  textual forms used in GPX files and human readable reports.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = Clock::duration;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// RFC 3339 in UTC, e.g. 2024-01-01T07:56:00Z
std::string ToRfc3339(TimePoint tp);

// Throws ValidationError on malformed input.
TimePoint FromRfc3339(const std::string& text);

// "2024-01-01 07:56:00"
std::string FormatDateTime(TimePoint tp);

// "07:56:00"
std::string FormatTimeOfDay(TimePoint tp);

bool SameDate(TimePoint a, TimePoint b);

// "[-]H:MM:SS", e.g. 2:00:00 or -0:00:30
std::string FormatDuration(Duration d);

} // namespace tracksync::util
