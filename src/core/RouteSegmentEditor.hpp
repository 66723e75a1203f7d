#pragma once
#include "core/RoutePlanner.hpp"
#include "models/CoreTypes.hpp"
#include <vector>

// Result of matching a map press against the current route.
// segment_index == -1 means the press did not hit the route.
struct SegmentMatch {
  int segment_index = -1;  // waypoint segment i (between wp[i] and wp[i+1])
  int insert_at_index = -1; // i + 1
  int nearest_geometry_index = -1;
  double distance_to_route = 0.0;
  Coordinate nearest_coordinate;

  bool found() const { return segment_index >= 0; }
};

// Drag-to-modify: press on the route line, preview, then confirm to insert a
// via waypoint at the projected point.
class RouteSegmentEditor {
public:
  static constexpr double kDefaultPressThresholdM = 50.0;

  explicit RouteSegmentEditor(RoutePlanner &planner,
                              double threshold_m = kDefaultPressThresholdM)
      : planner_(planner), threshold_m_(threshold_m) {}

  // Needs >= 2 waypoints and >= 2 geometry points. A press further than
  // `threshold_m` from the route gives no match.
  static SegmentMatch
  findSegmentForInsertion(const Coordinate &pressed,
                          const std::vector<Waypoint> &waypoints,
                          const Polyline &geometry,
                          double threshold_m = kDefaultPressThresholdM);

  // Match against the planner's current route and keep the result pending.
  // Returns the match (not found -> nothing pending).
  SegmentMatch handlePress(const Coordinate &pressed);

  bool hasPending() const { return pending_.found(); }
  const SegmentMatch &pending() const { return pending_; }

  // Inserts the pending via waypoint. InvalidIndex when nothing is pending.
  RouteStatus confirm();
  void cancel() { pending_ = SegmentMatch{}; }

private:
  RoutePlanner &planner_;
  double threshold_m_;
  SegmentMatch pending_;
};
