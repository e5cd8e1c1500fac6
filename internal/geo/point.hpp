#pragma once

#include <cmath>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace tracksync::geo {

// positions are kept with this many decimal digits
constexpr int kPositionDigits = 6;

struct Point {
  double                          latitude  = 0.0;
  double                          longitude = 0.0;
  std::optional<double>           elevation;
  std::optional<util::TimePoint> time;
};

struct Waypoint : Point {
  std::string name;
};

inline double RoundTo(double value, int digits) {
  const double scale = std::pow(10.0, digits);
  return std::round(value * scale) / scale;
}

inline void RoundPosition(Point& point, int digits = kPositionDigits) {
  point.latitude  = RoundTo(point.latitude, digits);
  point.longitude = RoundTo(point.longitude, digits);
}

inline bool SamePosition(const Point& a, const Point& b, int digits) {
  return RoundTo(a.latitude, digits) == RoundTo(b.latitude, digits) &&
         RoundTo(a.longitude, digits) == RoundTo(b.longitude, digits);
}

} // namespace tracksync::geo
