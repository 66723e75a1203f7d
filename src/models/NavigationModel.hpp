#pragma once

#include "models/CoreTypes.hpp"
#include <cstdint>
#include <string>

enum class NavigationStatus : uint8_t { Idle = 0, Active, Paused };

inline const char *NavigationStatusToString(NavigationStatus s) {
  switch (s) {
  case NavigationStatus::Active:
    return "active";
  case NavigationStatus::Paused:
    return "paused";
  default:
    return "idle";
  }
}

// One reading from the location provider. Speed and heading are optional in
// the provider's contract; the has_* flags carry that.
struct LocationFix {
  Coordinate coord;
  double speed_mps = 0.0;
  bool has_speed = false;
  double heading_deg = 0.0;
  bool has_heading = false;
  int64_t timestamp_ms = 0;
};

// What a single location update did to the session.
enum class UpdateOutcome : uint8_t {
  Ignored = 0,  // idle, paused or duplicate timestamp
  Updated,      // progress recomputed, route state unchanged
  WentOffRoute, // on-route -> off-route edge (alert)
  BackOnRoute   // off-route -> on-route edge
};

// Immutable copy of the session published to readers.
struct NavigationSnapshot {
  uint64_t sequence = 0; // events processed by the consumer
  NavigationStatus status = NavigationStatus::Idle;
  std::string route_id;
  std::string route_name;
  double total_distance = 0.0;

  bool has_location = false;
  Coordinate current_location;
  double current_speed = 0.0; // raw m/s, 0 when absent
  bool has_speed = false;
  double heading_deg = 0.0;
  bool has_heading = false;
  double smoothed_speed = 0.0;

  int nearest_index = 0;
  double distance_from_route = 0.0;
  bool is_off_route = false;

  double distance_traveled = 0.0;
  double distance_remaining = 0.0;
  double progress_percent = 0.0;

  double eta_seconds = 0.0;
  bool has_eta = false;

  int64_t last_fix_timestamp_ms = 0;
  std::string error;
};

// Display strings derived from a snapshot.
struct NavigationViewModel {
  bool is_navigating = false;
  bool is_paused = false;
  bool is_off_route = false;
  std::string route_name;
  double speed_kmh = 0.0;
  std::string speed;
  std::string distance_traveled;
  std::string distance_remaining;
  std::string time_remaining;
  double progress_percent = 0.0;
  double distance_from_route = 0.0;
};

// ---------- JSON ----------

inline void from_json(const Json &j, LocationFix &f) {
  f.coord.latitude = j.value("lat", 0.0);
  f.coord.longitude = j.value("lon", 0.0);
  // speed / heading may be absent or null
  f.has_speed = j.contains("speed") && j["speed"].is_number();
  f.speed_mps = f.has_speed ? j["speed"].get<double>() : 0.0;
  f.has_heading = j.contains("heading") && j["heading"].is_number();
  f.heading_deg = f.has_heading ? j["heading"].get<double>() : 0.0;
  f.timestamp_ms = j.value("timestamp", int64_t{0});
}

inline void to_json(Json &j, const NavigationSnapshot &s) {
  j = Json{{"sequence", s.sequence},
           {"status", NavigationStatusToString(s.status)},
           {"route_id", s.route_id},
           {"route_name", s.route_name},
           {"total_distance", s.total_distance},
           {"smoothed_speed", s.smoothed_speed},
           {"nearest_index", s.nearest_index},
           {"distance_from_route", s.distance_from_route},
           {"is_off_route", s.is_off_route},
           {"distance_traveled", s.distance_traveled},
           {"distance_remaining", s.distance_remaining},
           {"progress_percent", s.progress_percent}};
  j["current_location"] =
      s.has_location ? Json(s.current_location) : Json(nullptr);
  j["current_speed"] = s.has_speed ? Json(s.current_speed) : Json(nullptr);
  j["heading"] = s.has_heading ? Json(s.heading_deg) : Json(nullptr);
  j["eta_seconds"] = s.has_eta ? Json(s.eta_seconds) : Json(nullptr);
  if (!s.error.empty())
    j["error"] = s.error;
}

inline void to_json(Json &j, const NavigationViewModel &v) {
  j = Json{{"is_navigating", v.is_navigating},
           {"is_paused", v.is_paused},
           {"is_off_route", v.is_off_route},
           {"route_name", v.route_name},
           {"speed_kmh", v.speed_kmh},
           {"speed", v.speed},
           {"distance_traveled", v.distance_traveled},
           {"distance_remaining", v.distance_remaining},
           {"time_remaining", v.time_remaining},
           {"progress_percent", v.progress_percent},
           {"distance_from_route", v.distance_from_route}};
}
