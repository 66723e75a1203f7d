#pragma once

#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using Json = nlohmann::json;

// WGS84 position in degrees.
struct Coordinate {
  double latitude = 0.0;
  double longitude = 0.0;
};

inline bool operator==(const Coordinate &a, const Coordinate &b) {
  return a.latitude == b.latitude && a.longitude == b.longitude;
}
inline bool operator!=(const Coordinate &a, const Coordinate &b) {
  return !(a == b);
}

// Ordered path a rider is expected to follow.
using Polyline = std::vector<Coordinate>;

// Role of a waypoint inside a route's ordered list.
enum class WaypointKind : uint8_t { Start = 0, Via, End };

inline const char *WaypointKindToString(WaypointKind kind) {
  switch (kind) {
  case WaypointKind::Start:
    return "start";
  case WaypointKind::End:
    return "end";
  default:
    return "via";
  }
}

inline WaypointKind WaypointKindFromString(const std::string &s) {
  if (s == "start")
    return WaypointKind::Start;
  if (s == "end")
    return WaypointKind::End;
  return WaypointKind::Via;
}

// User-placed routing anchor.
struct Waypoint {
  std::string id;
  Coordinate coord;
  std::string name; // empty when unnamed
  WaypointKind kind = WaypointKind::Via;
  uint32_t order = 0;
};

inline bool operator==(const Waypoint &a, const Waypoint &b) {
  return a.id == b.id && a.coord == b.coord && a.name == b.name &&
         a.kind == b.kind && a.order == b.order;
}
inline bool operator!=(const Waypoint &a, const Waypoint &b) {
  return !(a == b);
}

// ---------- JSON ----------
// Coordinates travel as objects {"lat":..,"lon":..}; polylines in GeoJSON
// order [[lon,lat],...] (see RouteModel.hpp).

inline void to_json(Json &j, const Coordinate &c) {
  j = Json{{"lat", c.latitude}, {"lon", c.longitude}};
}

inline void from_json(const Json &j, Coordinate &c) {
  if (j.is_array() && j.size() >= 2) {
    c.longitude = j[0].get<double>();
    c.latitude = j[1].get<double>();
    return;
  }
  c.latitude = j.contains("lat") ? j.at("lat").get<double>()
                                 : j.value("latitude", 0.0);
  c.longitude = j.contains("lon") ? j.at("lon").get<double>()
                                  : j.value("longitude", 0.0);
}

inline void to_json(Json &j, const Waypoint &w) {
  j = Json{{"id", w.id},
           {"lat", w.coord.latitude},
           {"lon", w.coord.longitude},
           {"kind", WaypointKindToString(w.kind)},
           {"order", w.order}};
  if (!w.name.empty())
    j["name"] = w.name;
}

inline void from_json(const Json &j, Waypoint &w) {
  w.id = j.value("id", "");
  w.coord.latitude = j.value("lat", 0.0);
  w.coord.longitude = j.value("lon", 0.0);
  w.name = j.value("name", "");
  w.kind = WaypointKindFromString(j.value("kind", "via"));
  w.order = j.value("order", 0u);
}

inline Json polyline_to_json(const Polyline &line) {
  Json arr = Json::array();
  for (const auto &c : line)
    arr.push_back({c.longitude, c.latitude});
  return arr;
}

inline Polyline polyline_from_json(const Json &arr) {
  Polyline out;
  if (!arr.is_array())
    return out;
  out.reserve(arr.size());
  for (const auto &pt : arr) {
    // [lon, lat] pairs; skip anything malformed
    if (pt.is_array() && pt.size() >= 2)
      out.push_back(Coordinate{pt[1].get<double>(), pt[0].get<double>()});
  }
  return out;
}
