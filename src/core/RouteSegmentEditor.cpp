#include "core/RouteSegmentEditor.hpp"
#include "core/GeoUtils.hpp"
#include <iostream>

SegmentMatch RouteSegmentEditor::findSegmentForInsertion(
    const Coordinate &pressed, const std::vector<Waypoint> &waypoints,
    const Polyline &geometry, double threshold_m) {
  SegmentMatch out;
  if (waypoints.size() < 2 || geometry.size() < 2)
    return out;

  const auto cum = GeoUtils::cumulativeDistances(geometry);

  const NearestPoint press = GeoUtils::nearestPointOnPolyline(pressed, geometry);
  if (press.distance > threshold_m)
    return out;
  const double d_press = GeoUtils::distanceAlong(press, geometry, cum);

  // along-route position of every waypoint
  std::vector<double> along;
  along.reserve(waypoints.size());
  for (const auto &wp : waypoints) {
    NearestPoint np = GeoUtils::nearestPointOnPolyline(wp.coord, geometry);
    along.push_back(GeoUtils::distanceAlong(np, geometry, cum));
  }

  const int last_seg = static_cast<int>(waypoints.size()) - 2;
  int seg = -1;
  for (int i = last_seg; i >= 0; --i) {
    if (along[i] <= d_press && d_press <= along[i + 1]) {
      seg = i;
      break;
    }
  }
  if (seg < 0)
    seg = (d_press < along.front()) ? 0 : last_seg;

  out.segment_index = seg;
  out.insert_at_index = seg + 1;
  out.nearest_geometry_index = press.index;
  out.distance_to_route = press.distance;
  out.nearest_coordinate = press.closest;
  return out;
}

SegmentMatch RouteSegmentEditor::handlePress(const Coordinate &pressed) {
  pending_ = findSegmentForInsertion(pressed, planner_.waypoints(),
                                     planner_.geometry(), threshold_m_);
  return pending_;
}

RouteStatus RouteSegmentEditor::confirm() {
  if (!pending_.found())
    return RouteStatus::failure(RouteError::InvalidIndex,
                                "No pending route modification");
  const SegmentMatch m = pending_;
  pending_ = SegmentMatch{};
  RouteStatus st = planner_.insertViaWaypoint(m.nearest_coordinate,
                                              m.insert_at_index);
  if (st.ok())
    std::cout << "[planner] Inserted via waypoint at " << m.insert_at_index
              << " (" << m.distance_to_route << " m from route)" << std::endl;
  return st;
}
