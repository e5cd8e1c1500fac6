#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "internal/geo/point.hpp"

namespace tracksync::geo {

using Segment = std::vector<Point>;

/*
  GeoSequence

  Ordered segments of points plus free waypoints. Points are expected in
  ascending time order; nothing here sorts them.

  The fallback time stands in for first/last time when there are no
  points at all (a waypoint-only file still has a date).
*/
class GeoSequence {
 public:
  GeoSequence() = default;

  const std::vector<Segment>& Segments() const {
    return segments_;
  }

  std::vector<Segment>& MutableSegments() {
    return segments_;
  }

  const std::vector<Waypoint>& Waypoints() const {
    return waypoints_;
  }

  std::vector<Waypoint>& MutableWaypoints() {
    return waypoints_;
  }

  // All points of all segments, in order.
  std::vector<Point> Points() const;
  std::size_t        PointCount() const;

  bool Empty() const {
    return PointCount() == 0 && waypoints_.empty();
  }

  // Appends to the last segment, opening one if needed. Positions are rounded.
  void AddPoints(const std::vector<Point>& points);
  void AddWaypoint(Waypoint waypoint);

  void Clear();

  void SetFallbackTime(std::optional<util::TimePoint> time) {
    fallback_time_ = time;
  }

  // ------------------------------------------------------------------
  // Derived values
  // ------------------------------------------------------------------
  std::optional<util::TimePoint> FirstTime() const;
  std::optional<util::TimePoint> LastTime() const;

  // Great circle length in km, rounded to metres.
  double Distance() const;

  // km/h over the whole time span.
  std::optional<double> Speed() const;

  // km/h ignoring intervals slower than 1 km/h.
  std::optional<double> MovingSpeed() const;

  // Bearing from first to last point in degrees, 0..360. 0 without two distinct points.
  double Angle() const;

  // Shifts every point and waypoint time.
  void AdjustTime(util::Duration delta);

  // Rounds every point and waypoint position.
  void RoundPoints(int digits = kPositionDigits);

  // Stable hash over all point positions.
  std::uint64_t PointsHash() const;

 private:
  std::vector<Segment>           segments_;
  std::vector<Waypoint>          waypoints_;
  std::optional<util::TimePoint> fallback_time_;
};

// ------------------------------------------------------------------
// Comparisons between sequences
// ------------------------------------------------------------------

// Haversine distance in km.
double DistanceKm(const Point& a, const Point& b);

// Same number of points and same positions at `digits` precision.
bool PointsEqual(const GeoSequence& a, const GeoSequence& b, int digits);

// Start offset of `needle`'s points inside `haystack`'s points, brute force.
std::optional<std::size_t> Index(const GeoSequence& haystack, const GeoSequence& needle, int digits);

// Delta between first times if it also equals the delta between last times.
std::optional<util::Duration> TimeOffset(const GeoSequence& self, const GeoSequence& other);

// Ramer-Douglas-Peucker; max_distance in metres.
std::vector<Point> Simplify(const std::vector<Point>& points, double max_distance);

} // namespace tracksync::geo
