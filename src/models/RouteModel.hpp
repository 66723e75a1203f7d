#pragma once

#include "models/CoreTypes.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// How the route under construction is turned into geometry.
enum class PlanningMode : uint8_t {
  PointToPoint = 0, // road-snapped via the routing service
  Freeform,         // waypoints connected directly
  ModifyExisting    // editing a saved route, road-snapped
};

inline const char *PlanningModeToString(PlanningMode mode) {
  switch (mode) {
  case PlanningMode::Freeform:
    return "freeform";
  case PlanningMode::ModifyExisting:
    return "modify-existing";
  default:
    return "point-to-point";
  }
}

inline PlanningMode PlanningModeFromString(const std::string &s) {
  if (s == "freeform")
    return PlanningMode::Freeform;
  if (s == "modify-existing")
    return PlanningMode::ModifyExisting;
  return PlanningMode::PointToPoint;
}

// One manoeuvre returned by the routing service.
struct RouteInstruction {
  std::string type;
  std::string text;
  double distance = 0.0; // metres
  double duration = 0.0; // seconds
  std::string modifier;
};

// Result of a routing service call.
struct CalculatedRoute {
  Polyline geometry;
  double distance_m = 0.0;
  double duration_s = 0.0;
  std::vector<RouteInstruction> instructions;
};

// Self-contained record handed to persistence on save.
struct RouteRecord {
  std::string id;
  std::string name;
  std::string description;
  PlanningMode mode = PlanningMode::PointToPoint;
  std::vector<Waypoint> waypoints;
  Polyline geometry;
  double distance_m = 0.0;
  double duration_s = 0.0;
  std::string base_route_id;        // set when derived from a saved route
  std::string geometry_fingerprint; // SHA-256 hex
  std::string created_at;           // ISO-8601 UTC
  std::string updated_at;
};

// Compact listing row.
struct RouteSummary {
  std::string id;
  std::string name;
  PlanningMode mode = PlanningMode::PointToPoint;
  double distance_m = 0.0;
  int waypoint_count = 0;
  std::string updated_at;
};

// Undo/redo snapshot. Holds its own copies; never aliases live state.
struct HistoryEntry {
  std::vector<Waypoint> waypoints;
  Polyline geometry;
  int64_t timestamp_ms = 0;
};

// Caller-visible failure codes for planner and navigation operations.
enum class RouteError : uint8_t {
  None = 0,
  NotPlanning,
  WaypointNotFound,
  InvalidIndex,
  TooFewWaypoints,
  InvalidRoute,
  RoutingFailed,
  NotNavigating,
  LocationUnavailable,
  CalculationInProgress
};

inline const char *RouteErrorToString(RouteError e) {
  switch (e) {
  case RouteError::None:
    return "none";
  case RouteError::NotPlanning:
    return "not_planning";
  case RouteError::WaypointNotFound:
    return "waypoint_not_found";
  case RouteError::InvalidIndex:
    return "invalid_index";
  case RouteError::TooFewWaypoints:
    return "too_few_waypoints";
  case RouteError::InvalidRoute:
    return "invalid_route";
  case RouteError::RoutingFailed:
    return "routing_failed";
  case RouteError::NotNavigating:
    return "not_navigating";
  case RouteError::LocationUnavailable:
    return "location_unavailable";
  case RouteError::CalculationInProgress:
    return "calculation_in_progress";
  }
  return "unknown";
}

struct RouteStatus {
  RouteError error = RouteError::None;
  std::string message;

  bool ok() const { return error == RouteError::None; }

  static RouteStatus success() { return {}; }
  static RouteStatus failure(RouteError e, std::string msg) {
    return RouteStatus{e, std::move(msg)};
  }
};

// ---------- JSON ----------

inline void to_json(Json &j, const RouteInstruction &i) {
  j = Json{{"type", i.type},
           {"text", i.text},
           {"distance", i.distance},
           {"duration", i.duration}};
  if (!i.modifier.empty())
    j["modifier"] = i.modifier;
}

inline void from_json(const Json &j, RouteInstruction &i) {
  i.type = j.value("type", "");
  i.text = j.value("text", "");
  i.distance = j.value("distance", 0.0);
  i.duration = j.value("duration", 0.0);
  i.modifier = j.value("modifier", "");
}

inline void to_json(Json &j, const RouteRecord &r) {
  j = Json{{"id", r.id},
           {"name", r.name},
           {"description", r.description},
           {"mode", PlanningModeToString(r.mode)},
           {"waypoints", r.waypoints},
           {"geometry", polyline_to_json(r.geometry)},
           {"distance", r.distance_m},
           {"duration", r.duration_s},
           {"geometry_fingerprint", r.geometry_fingerprint},
           {"created_at", r.created_at},
           {"updated_at", r.updated_at}};
  if (!r.base_route_id.empty())
    j["base_route_id"] = r.base_route_id;
}

inline void from_json(const Json &j, RouteRecord &r) {
  r.id = j.value("id", "");
  r.name = j.value("name", "");
  r.description = j.value("description", "");
  r.mode = PlanningModeFromString(j.value("mode", "point-to-point"));
  r.waypoints.clear();
  if (j.contains("waypoints") && j["waypoints"].is_array()) {
    for (const auto &w : j["waypoints"])
      r.waypoints.push_back(w.get<Waypoint>());
  }
  r.geometry = polyline_from_json(j.value("geometry", Json::array()));
  r.distance_m = j.value("distance", 0.0);
  r.duration_s = j.value("duration", 0.0);
  r.base_route_id = j.value("base_route_id", "");
  r.geometry_fingerprint = j.value("geometry_fingerprint", "");
  r.created_at = j.value("created_at", "");
  r.updated_at = j.value("updated_at", "");
}

inline void to_json(Json &j, const RouteSummary &s) {
  j = Json{{"id", s.id},
           {"name", s.name},
           {"mode", PlanningModeToString(s.mode)},
           {"distance", s.distance_m},
           {"waypoint_count", s.waypoint_count},
           {"updated_at", s.updated_at}};
}

inline void to_json(Json &j, const RouteStatus &s) {
  j = Json{{"ok", s.ok()}};
  if (!s.ok()) {
    j["error"] = RouteErrorToString(s.error);
    j["message"] = s.message;
  }
}
