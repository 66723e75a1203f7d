#pragma once
#include "models/CoreTypes.hpp"
#include <string>
#include <vector>

// Pure helpers over an ordered waypoint list.

// First -> Start, last -> End, rest -> Via; order = position. A lone
// waypoint is a Start.
inline std::vector<Waypoint> assignWaypointKinds(std::vector<Waypoint> wps) {
  const size_t n = wps.size();
  for (size_t i = 0; i < n; ++i) {
    wps[i].kind = (i == 0)       ? WaypointKind::Start
                  : (i == n - 1) ? WaypointKind::End
                                 : WaypointKind::Via;
    wps[i].order = static_cast<uint32_t>(i);
  }
  return wps;
}

// Returns the position of `id`, or -1.
inline int findWaypointIndex(const std::vector<Waypoint> &wps,
                             const std::string &id) {
  for (size_t i = 0; i < wps.size(); ++i) {
    if (wps[i].id == id)
      return static_cast<int>(i);
  }
  return -1;
}

inline std::vector<Coordinate>
waypointCoordinates(const std::vector<Waypoint> &wps) {
  std::vector<Coordinate> out;
  out.reserve(wps.size());
  for (const auto &w : wps)
    out.push_back(w.coord);
  return out;
}
