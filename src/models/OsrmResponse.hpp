#pragma once

#include "models/CoreTypes.hpp"
#include "models/RouteModel.hpp"
#include <array>
#include <stdexcept>
#include <string>
#include <vector>

using Coord = std::array<double, 2>; // [lon, lat]

// Structures modelling the subset of OSRM's /route JSON response we care
// about.

// ---------- Geometry ----------
struct Geometry {
  std::string type; // e.g., "LineString"
  std::vector<Coord> coordinates;
};

// ---------- Steps -------------
struct Maneuver {
  std::string type;
  std::string modifier;
  std::string instruction; // Mapbox-flavoured servers only
  Coord location{0.0, 0.0};
};

struct Step {
  double distance = 0.0;
  double duration = 0.0;
  std::string name;
  Maneuver maneuver;
};

// ---------- Legs --------------
struct Leg {
  double distance = 0.0;
  double duration = 0.0;
  std::string summary;
  std::vector<Step> steps;
};

// ---------- Route -------------
struct OsrmRoute {
  Geometry geometry;
  std::vector<Leg> legs;
  std::string weight_name;
  double weight = 0.0;
  double duration = 0.0;
  double distance = 0.0;
};

struct OsrmWaypoint {
  std::string name;
  Coord location{0.0, 0.0};
  double distance = 0.0; // snap distance from the requested point
};

struct OsrmRouteResponse {
  std::string code;
  std::string message;
  std::vector<OsrmRoute> routes;
  std::vector<OsrmWaypoint> waypoints;
};

// Define from_json() overloads for structs to work with json::get() function

inline Coord coord_from_json(const Json &j) {
  if (j.is_array() && j.size() >= 2)
    return {j[0].get<double>(), j[1].get<double>()};
  return {0.0, 0.0};
}

// --- Geometry ----
inline void from_json(const Json &j, Geometry &g) {
  g.type = j.value("type", "");
  g.coordinates.clear();
  if (j.contains("coordinates") && j["coordinates"].is_array()) {
    for (const auto &pt : j["coordinates"]) {
      // each entry must carry at least x (lon) and y (lat)
      if (pt.is_array() && pt.size() >= 2)
        g.coordinates.push_back({pt[0].get<double>(), pt[1].get<double>()});
    }
  }
}

// --- Maneuver / Step ----
inline void from_json(const Json &j, Maneuver &m) {
  m.type = j.value("type", "");
  m.modifier = j.value("modifier", "");
  m.instruction = j.value("instruction", "");
  if (j.contains("location"))
    m.location = coord_from_json(j["location"]);
}

inline void from_json(const Json &j, Step &s) {
  s.distance = j.value("distance", 0.0);
  s.duration = j.value("duration", 0.0);
  s.name = j.value("name", "");
  if (j.contains("maneuver") && j["maneuver"].is_object())
    s.maneuver = j["maneuver"].get<Maneuver>();
}

// --- Legs ----
inline void from_json(const Json &j, Leg &l) {
  l.distance = j.value("distance", 0.0);
  l.duration = j.value("duration", 0.0);
  l.summary = j.value("summary", "");
  l.steps.clear();
  if (j.contains("steps") && j["steps"].is_array()) {
    for (const auto &s : j["steps"])
      l.steps.push_back(s.get<Step>());
  }
}

// --- Route ----
inline void from_json(const Json &j, OsrmRoute &r) {
  if (j.contains("geometry") && j["geometry"].is_object())
    r.geometry = j["geometry"].get<Geometry>();
  r.weight_name = j.value("weight_name", "");
  r.weight = j.value("weight", 0.0);
  r.duration = j.value("duration", 0.0);
  r.distance = j.value("distance", 0.0);

  r.legs.clear();
  if (j.contains("legs") && j["legs"].is_array()) {
    for (const auto &L : j["legs"])
      r.legs.push_back(L.get<Leg>());
  }
}

inline void from_json(const Json &j, OsrmWaypoint &w) {
  w.name = j.value("name", "");
  w.distance = j.value("distance", 0.0);
  if (j.contains("location"))
    w.location = coord_from_json(j["location"]);
}

// --- OsrmRouteResponse ----
inline void from_json(const Json &j, OsrmRouteResponse &r) {
  r.code = j.value("code", "Error");
  r.message = j.value("message", "");
  r.routes.clear();
  if (j.contains("routes") && j["routes"].is_array()) {
    for (const auto &rt : j["routes"])
      r.routes.push_back(rt.get<OsrmRoute>());
  }
  r.waypoints.clear();
  if (j.contains("waypoints") && j["waypoints"].is_array()) {
    for (const auto &w : j["waypoints"])
      r.waypoints.push_back(w.get<OsrmWaypoint>());
  }
}

// Convert the first route of a successful response into engine types.
// Throws when the server reported an error or returned no route.
inline CalculatedRoute to_calculated_route(const OsrmRouteResponse &r) {
  if (r.code != "Ok")
    throw std::runtime_error("OSRM routing failed: " + r.code +
                             (r.message.empty() ? "" : " (" + r.message + ")"));
  if (r.routes.empty())
    throw std::runtime_error("No route found");

  const auto &route = r.routes.front();
  CalculatedRoute out;
  out.distance_m = route.distance;
  out.duration_s = route.duration;
  out.geometry.reserve(route.geometry.coordinates.size());
  for (const auto &c : route.geometry.coordinates)
    out.geometry.push_back(Coordinate{c[1], c[0]}); // [lon, lat] -> lat/lon

  for (const auto &leg : route.legs) {
    for (const auto &step : leg.steps) {
      RouteInstruction ins;
      ins.type = step.maneuver.type;
      // prefer the server's sentence, then the road name, then the type
      ins.text = !step.maneuver.instruction.empty() ? step.maneuver.instruction
                 : !step.name.empty()               ? step.name
                                                    : step.maneuver.type;
      ins.distance = step.distance;
      ins.duration = step.duration;
      ins.modifier = step.maneuver.modifier;
      out.instructions.push_back(std::move(ins));
    }
  }
  return out;
}
