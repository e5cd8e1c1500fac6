#include "geo_sequence.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <utility>

namespace tracksync::geo {

namespace {

constexpr double kEarthRadiusKm   = 6371.0;
constexpr double kMovingThreshold = 1.0; // km/h

double Radians(double degrees) {
  return degrees * std::numbers::pi / 180.0;
}

double Hours(util::Duration d) {
  return std::chrono::duration<double, std::ratio<3600>>(d).count();
}

void HashBytes(std::uint64_t& hash, std::int64_t value) {
  for (int i = 0; i < 8; ++i) {
    hash ^= static_cast<std::uint64_t>((value >> (i * 8)) & 0xff);
    hash *= 1099511628211ULL;
  }
}

// distance of p from the line a-b in metres, on a local flat projection
double PerpendicularDistance(const Point& p, const Point& a, const Point& b) {
  const double lat0  = Radians(a.latitude);
  const double scale = kEarthRadiusKm * 1000.0;
  auto         x     = [&](const Point& q) { return Radians(q.longitude - a.longitude) * std::cos(lat0) * scale; };
  auto         y     = [&](const Point& q) { return Radians(q.latitude - a.latitude) * scale; };

  const double bx = x(b), by = y(b);
  const double px = x(p), py = y(p);
  const double len = std::hypot(bx, by);
  if (len == 0.0) {
    return std::hypot(px, py);
  }
  return std::fabs(bx * py - by * px) / len;
}

} // namespace

std::vector<Point> GeoSequence::Points() const {
  std::vector<Point> result;
  result.reserve(PointCount());
  for (const auto& segment : segments_) {
    result.insert(result.end(), segment.begin(), segment.end());
  }
  return result;
}

std::size_t GeoSequence::PointCount() const {
  std::size_t count = 0;
  for (const auto& segment : segments_) {
    count += segment.size();
  }
  return count;
}

void GeoSequence::AddPoints(const std::vector<Point>& points) {
  if (points.empty()) {
    return;
  }
  if (segments_.empty()) {
    segments_.emplace_back();
  }
  auto& segment = segments_.back();
  for (auto point : points) {
    RoundPosition(point);
    segment.push_back(std::move(point));
  }
}

void GeoSequence::AddWaypoint(Waypoint waypoint) {
  RoundPosition(waypoint);
  waypoints_.push_back(std::move(waypoint));
}

void GeoSequence::Clear() {
  segments_.clear();
  waypoints_.clear();
  fallback_time_.reset();
}

std::optional<util::TimePoint> GeoSequence::FirstTime() const {
  for (const auto& segment : segments_) {
    for (const auto& point : segment) {
      if (point.time) {
        return point.time;
      }
    }
  }
  return fallback_time_;
}

std::optional<util::TimePoint> GeoSequence::LastTime() const {
  for (auto segment = segments_.rbegin(); segment != segments_.rend(); ++segment) {
    for (auto point = segment->rbegin(); point != segment->rend(); ++point) {
      if (point->time) {
        return point->time;
      }
    }
  }
  return fallback_time_;
}

double GeoSequence::Distance() const {
  double total = 0.0;
  for (const auto& segment : segments_) {
    for (std::size_t i = 1; i < segment.size(); ++i) {
      total += DistanceKm(segment[i - 1], segment[i]);
    }
  }
  return RoundTo(total, 3);
}

std::optional<double> GeoSequence::Speed() const {
  auto first = FirstTime();
  auto last  = LastTime();
  if (!first || !last || *last <= *first) {
    return std::nullopt;
  }
  return Distance() / Hours(*last - *first);
}

std::optional<double> GeoSequence::MovingSpeed() const {
  double distance = 0.0;
  double hours    = 0.0;
  for (const auto& segment : segments_) {
    for (std::size_t i = 1; i < segment.size(); ++i) {
      const auto& prev = segment[i - 1];
      const auto& cur  = segment[i];
      if (!prev.time || !cur.time || *cur.time <= *prev.time) {
        continue;
      }
      const double step_km    = DistanceKm(prev, cur);
      const double step_hours = Hours(*cur.time - *prev.time);
      if (step_km / step_hours >= kMovingThreshold) {
        distance += step_km;
        hours += step_hours;
      }
    }
  }
  if (hours == 0.0) {
    return std::nullopt;
  }
  return distance / hours;
}

double GeoSequence::Angle() const {
  auto points = Points();
  if (points.size() < 2) {
    return 0.0;
  }
  const auto&  first     = points.front();
  const auto&  last      = points.back();
  const double norm_lat  = (last.latitude - first.latitude) / 90.0;
  const double norm_long = (last.longitude - first.longitude) / 180.0;
  const double length    = std::sqrt(norm_lat * norm_lat + norm_long * norm_long);
  if (length == 0.0) {
    return 0.0;
  }
  const double result = std::asin(norm_long / length) * 180.0 / std::numbers::pi;
  if (norm_lat >= 0) {
    return std::fmod(360.0 + result, 360.0);
  }
  return 180.0 - result;
}

void GeoSequence::AdjustTime(util::Duration delta) {
  for (auto& segment : segments_) {
    for (auto& point : segment) {
      if (point.time) {
        *point.time += delta;
      }
    }
  }
  for (auto& waypoint : waypoints_) {
    if (waypoint.time) {
      *waypoint.time += delta;
    }
  }
  if (fallback_time_) {
    *fallback_time_ += delta;
  }
}

void GeoSequence::RoundPoints(int digits) {
  for (auto& segment : segments_) {
    for (auto& point : segment) {
      RoundPosition(point, digits);
    }
  }
  for (auto& waypoint : waypoints_) {
    RoundPosition(waypoint, digits);
  }
}

std::uint64_t GeoSequence::PointsHash() const {
  std::uint64_t hash = 14695981039346656037ULL;
  for (const auto& segment : segments_) {
    for (const auto& point : segment) {
      HashBytes(hash, std::llround(point.latitude * 1e6));
      HashBytes(hash, std::llround(point.longitude * 1e6));
    }
  }
  return hash;
}

// ------------------------------------------------------------------
// Free functions
// ------------------------------------------------------------------

double DistanceKm(const Point& a, const Point& b) {
  const double dlat = Radians(b.latitude - a.latitude);
  const double dlon = Radians(b.longitude - a.longitude);
  const double h    = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(Radians(a.latitude)) * std::cos(Radians(b.latitude)) * std::sin(dlon / 2) * std::sin(dlon / 2);
  return 2 * kEarthRadiusKm * std::asin(std::min(1.0, std::sqrt(h)));
}

bool PointsEqual(const GeoSequence& a, const GeoSequence& b, int digits) {
  auto left  = a.Points();
  auto right = b.Points();
  if (left.size() != right.size()) {
    return false;
  }
  for (std::size_t i = 0; i < left.size(); ++i) {
    if (!SamePosition(left[i], right[i], digits)) {
      return false;
    }
  }
  return true;
}

std::optional<std::size_t> Index(const GeoSequence& haystack, const GeoSequence& needle, int digits) {
  auto outer = haystack.Points();
  auto inner = needle.Points();
  if (inner.empty() || inner.size() > outer.size()) {
    return std::nullopt;
  }
  for (std::size_t start = 0; start + inner.size() <= outer.size(); ++start) {
    bool match = true;
    for (std::size_t i = 0; i < inner.size(); ++i) {
      if (!SamePosition(outer[start + i], inner[i], digits)) {
        match = false;
        break;
      }
    }
    if (match) {
      return start;
    }
  }
  return std::nullopt;
}

std::optional<util::Duration> TimeOffset(const GeoSequence& self, const GeoSequence& other) {
  auto self_first  = self.FirstTime();
  auto other_first = other.FirstTime();
  auto self_last   = self.LastTime();
  auto other_last  = other.LastTime();
  if (!self_first || !other_first || !self_last || !other_last) {
    return std::nullopt;
  }
  const auto start_delta = *other_first - *self_first;
  const auto end_delta   = *other_last - *self_last;
  if (start_delta != end_delta) {
    return std::nullopt;
  }
  return start_delta;
}

std::vector<Point> Simplify(const std::vector<Point>& points, double max_distance) {
  if (points.size() < 3) {
    return points;
  }

  std::vector<bool>                                keep(points.size(), false);
  std::vector<std::pair<std::size_t, std::size_t>> ranges{{0, points.size() - 1}};
  keep.front() = true;
  keep.back()  = true;

  while (!ranges.empty()) {
    auto [first, last] = ranges.back();
    ranges.pop_back();

    double      worst       = 0.0;
    std::size_t worst_index = first;
    for (std::size_t i = first + 1; i < last; ++i) {
      const double d = PerpendicularDistance(points[i], points[first], points[last]);
      if (d > worst) {
        worst       = d;
        worst_index = i;
      }
    }
    if (worst > max_distance) {
      keep[worst_index] = true;
      ranges.emplace_back(first, worst_index);
      ranges.emplace_back(worst_index, last);
    }
  }

  std::vector<Point> result;
  for (std::size_t i = 0; i < points.size(); ++i) {
    if (keep[i]) {
      result.push_back(points[i]);
    }
  }
  return result;
}

} // namespace tracksync::geo
