#pragma once
#include "models/CoreTypes.hpp"
#include <limits>
#include <string>
#include <vector>

// Closest point on one segment.
struct SegmentProjection {
  double distance = 0.0; // metres from the query point
  Coordinate closest;
};

// Closest point on a whole polyline. `index` is the start vertex of the
// segment holding `closest`.
struct NearestPoint {
  int index = 0;
  double distance = std::numeric_limits<double>::infinity();
  Coordinate closest;
};

// Stateless geometry kernel. Every distance in the engine comes from
// haversine() so downstream values share its (~0.5%) error.
class GeoUtils {
public:
  static constexpr double kEarthRadiusM = 6371000.0;

  // haversine formulas
  static double haversine(double lat1, double lon1, double lat2, double lon2);
  static double haversine(const Coordinate &a, const Coordinate &b);

  // Planar projection in degree space, t clamped to [0,1]. A zero-length
  // segment degenerates to the distance to `a`.
  static SegmentProjection projectOntoSegment(const Coordinate &p,
                                              const Coordinate &a,
                                              const Coordinate &b);

  // Linear scan over all segments; the earliest segment wins ties.
  static NearestPoint nearestPointOnPolyline(const Coordinate &p,
                                             const Polyline &line);

  // Prefix sums of segment lengths; out[0] == 0, empty in -> empty out.
  static std::vector<double> cumulativeDistances(const Polyline &line);

  static double pathDistance(const Polyline &line);

  // Along-route distance of a projected point.
  static double distanceAlong(const NearestPoint &nearest, const Polyline &line,
                              const std::vector<double> &cumulative);

  // Point at `target` metres from the start, linearly interpolated. Past the
  // end returns the last vertex. Throws std::invalid_argument on empty input.
  static Coordinate coordinateAtDistance(const Polyline &line, double target,
                                         const std::vector<double> &cumulative);

  // Resample at a fixed spacing (first and last vertex always kept).
  static Polyline samplePath(const Polyline &line, double step_m);

  struct BBox {
    double min_lat, min_lon, max_lat, max_lon;
  };
  static BBox compute_bbox(const Polyline &pts);

  // SHA-256 (hex) of the polyline rounded to 1e-6 deg with consecutive
  // duplicates removed. Identical paths hash identically.
  static std::string geometryFingerprint(const Polyline &line);
};
