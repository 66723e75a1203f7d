#include "core/RoutePlanner.hpp"
#include "core/GeoUtils.hpp"
#include "core/TimeUtils.hpp"
#include "core/WaypointList.hpp"
#include <iostream>
#include <stdexcept>

namespace {
const char *kRoutingFailedMessage =
    "Failed to calculate route. Please try again.";

RouteStatus notPlanning() {
  return RouteStatus::failure(RouteError::NotPlanning,
                              "Route planning is not active");
}
} // namespace

RoutePlanner::RoutePlanner(RoutingService *router, PlanningParams params,
                           std::string profile)
    : router_(router), params_(params), profile_(std::move(profile)),
      history_(params.max_history), rng_(std::random_device{}()) {}

// ---------------- lifecycle ----------------

void RoutePlanner::resetState() {
  waypoints_.clear();
  geometry_.clear();
  distance_m_ = 0.0;
  duration_s_ = 0.0;
  instructions_.clear();
  base_route_id_.clear();
  history_.clear();
  move_pending_ = false;
  calculating_ = false;
  ++session_;
  error_.clear();
}

void RoutePlanner::startPlanning(PlanningMode mode) {
  resetState();
  planning_ = true;
  mode_ = mode;
  // the empty route is the undo floor
  history_.seed(HistoryEntry{waypoints_, geometry_, now_epoch_ms()});
}

void RoutePlanner::loadExistingRoute(const RouteRecord &route) {
  resetState();
  planning_ = true;
  mode_ = PlanningMode::ModifyExisting;
  waypoints_ = assignWaypointKinds(route.waypoints);
  geometry_ = route.geometry;
  distance_m_ = route.distance_m;
  duration_s_ = route.duration_s;
  base_route_id_ = route.id;
  history_.seed(HistoryEntry{waypoints_, geometry_, now_epoch_ms()});
  std::cout << "[planner] Loaded route " << route.id << " ("
            << waypoints_.size() << " waypoints, " << geometry_.size()
            << " points)" << std::endl;
}

void RoutePlanner::cancelPlanning() {
  resetState();
  planning_ = false;
  mode_ = PlanningMode::PointToPoint;
}

RouteStatus RoutePlanner::requirePlanning() const {
  if (!planning_)
    return notPlanning();
  return RouteStatus::success();
}

// ---------------- history ----------------

void RoutePlanner::pushHistory() {
  history_.push(HistoryEntry{waypoints_, geometry_, now_epoch_ms()});
}

void RoutePlanner::restore(const HistoryEntry &entry) {
  waypoints_ = entry.waypoints;
  if (entry.geometry != geometry_) {
    geometry_ = entry.geometry;
    distance_m_ = GeoUtils::pathDistance(geometry_);
    duration_s_ = 0.0;
    instructions_.clear();
  }
  move_pending_ = false;
}

void RoutePlanner::undo() {
  if (const HistoryEntry *e = history_.undo())
    restore(*e);
}

void RoutePlanner::redo() {
  if (const HistoryEntry *e = history_.redo())
    restore(*e);
}

// ---------------- waypoints ----------------

RouteStatus RoutePlanner::addWaypoint(const Coordinate &coord,
                                      const std::string &name) {
  if (auto st = requirePlanning(); !st.ok())
    return st;

  Waypoint wp;
  wp.id = generateId();
  wp.coord = coord;
  wp.name = name;
  waypoints_.push_back(std::move(wp));
  waypoints_ = assignWaypointKinds(std::move(waypoints_));
  move_pending_ = false;
  pushHistory();
  return RouteStatus::success();
}

RouteStatus RoutePlanner::insertViaWaypoint(const Coordinate &coord,
                                            int index) {
  if (auto st = requirePlanning(); !st.ok())
    return st;
  const int n = static_cast<int>(waypoints_.size());
  if (n < 2 || index < 1 || index > n - 1)
    return RouteStatus::failure(RouteError::InvalidIndex,
                                "Via waypoint index out of range: " +
                                    std::to_string(index));

  Waypoint wp;
  wp.id = generateId();
  wp.coord = coord;
  waypoints_.insert(waypoints_.begin() + index, std::move(wp));
  waypoints_ = assignWaypointKinds(std::move(waypoints_));
  move_pending_ = false;
  pushHistory();
  return RouteStatus::success();
}

RouteStatus RoutePlanner::removeWaypoint(const std::string &id) {
  if (auto st = requirePlanning(); !st.ok())
    return st;
  const int idx = findWaypointIndex(waypoints_, id);
  if (idx < 0)
    return RouteStatus::failure(RouteError::WaypointNotFound,
                                "No waypoint with id " + id);

  waypoints_.erase(waypoints_.begin() + idx);
  waypoints_ = assignWaypointKinds(std::move(waypoints_));
  move_pending_ = false;
  pushHistory();
  return RouteStatus::success();
}

RouteStatus RoutePlanner::moveWaypoint(const std::string &id,
                                       const Coordinate &coord) {
  if (auto st = requirePlanning(); !st.ok())
    return st;
  const int idx = findWaypointIndex(waypoints_, id);
  if (idx < 0)
    return RouteStatus::failure(RouteError::WaypointNotFound,
                                "No waypoint with id " + id);

  waypoints_[idx].coord = coord;
  move_pending_ = true;
  return RouteStatus::success();
}

RouteStatus RoutePlanner::finishMoveWaypoint() {
  if (auto st = requirePlanning(); !st.ok())
    return st;
  if (move_pending_) {
    move_pending_ = false;
    pushHistory();
  }
  return RouteStatus::success();
}

RouteStatus RoutePlanner::reorderWaypoints(int from, int to) {
  if (auto st = requirePlanning(); !st.ok())
    return st;
  const int n = static_cast<int>(waypoints_.size());
  if (from < 0 || from >= n || to < 0 || to >= n)
    return RouteStatus::failure(RouteError::InvalidIndex,
                                "Reorder index out of range");
  if (from == to)
    return RouteStatus::success();

  Waypoint moved = std::move(waypoints_[from]);
  waypoints_.erase(waypoints_.begin() + from);
  waypoints_.insert(waypoints_.begin() + to, std::move(moved));
  waypoints_ = assignWaypointKinds(std::move(waypoints_));
  move_pending_ = false;
  pushHistory();
  return RouteStatus::success();
}

RouteStatus RoutePlanner::clearWaypoints() {
  if (auto st = requirePlanning(); !st.ok())
    return st;
  waypoints_.clear();
  geometry_.clear();
  distance_m_ = 0.0;
  duration_s_ = 0.0;
  instructions_.clear();
  move_pending_ = false;
  pushHistory();
  return RouteStatus::success();
}

// ---------------- geometry ----------------

RouteStatus RoutePlanner::calculateRoute() {
  RouteRequest req;
  RouteStatus st = beginCalculation(req);
  if (!st.ok() || !req.needs_router)
    return st;

  CalculatedRoute result;
  try {
    result = router_->calculate(req.points, req.profile);
  } catch (const std::exception &e) {
    return failCalculation(req, e.what());
  }
  return completeCalculation(req, std::move(result));
}

RouteStatus RoutePlanner::beginCalculation(RouteRequest &req) {
  req = RouteRequest{};
  if (auto st = requirePlanning(); !st.ok())
    return st;
  if (waypoints_.size() < 2)
    return RouteStatus::failure(RouteError::TooFewWaypoints,
                                "At least two waypoints are required");
  if (calculating_)
    return RouteStatus::failure(RouteError::CalculationInProgress,
                                "A route calculation is already running");

  const std::vector<Coordinate> coords = waypointCoordinates(waypoints_);

  if (mode_ == PlanningMode::Freeform) {
    geometry_ = coords;
    distance_m_ = GeoUtils::pathDistance(geometry_);
    duration_s_ = 0.0;
    instructions_.clear();
    error_.clear();
    return RouteStatus::success();
  }

  if (!router_) {
    error_ = kRoutingFailedMessage;
    return RouteStatus::failure(RouteError::RoutingFailed,
                                "No routing service configured");
  }

  calculating_ = true;
  error_.clear();
  req.points = coords;
  req.profile = profile_;
  req.session = session_;
  req.needs_router = true;
  return RouteStatus::success();
}

RouteStatus RoutePlanner::completeCalculation(const RouteRequest &req,
                                              CalculatedRoute result) {
  if (!planning_ || req.session != session_) {
    std::cerr << "[planner] Dropping route for a finished planning session"
              << std::endl;
    return RouteStatus::failure(RouteError::NotPlanning,
                                "Planning session changed during calculation");
  }
  if (result.geometry.size() < 2)
    return failCalculation(req, "Routing service returned an empty geometry");

  calculating_ = false;
  geometry_ = std::move(result.geometry);
  distance_m_ = result.distance_m;
  duration_s_ = result.duration_s;
  instructions_ = std::move(result.instructions);
  std::cout << "[planner] Route calculated: " << geometry_.size()
            << " points, " << distance_m_ << " m" << std::endl;
  return RouteStatus::success();
}

RouteStatus RoutePlanner::failCalculation(const RouteRequest &req,
                                          const std::string &reason) {
  std::cerr << "[planner] Route calculation failed: " << reason << std::endl;
  if (!planning_ || req.session != session_)
    return RouteStatus::failure(RouteError::NotPlanning,
                                "Planning session changed during calculation");
  calculating_ = false;
  error_ = kRoutingFailedMessage;
  return RouteStatus::failure(RouteError::RoutingFailed, error_);
}

void RoutePlanner::setGeometry(const Polyline &geometry) {
  geometry_ = geometry;
  distance_m_ = GeoUtils::pathDistance(geometry_);
}

RouteRecord RoutePlanner::prepareForSave(const std::string &name,
                                         const std::string &description) {
  const int64_t now = now_epoch_ms();
  const std::string stamp = iso8601_utc(now);

  RouteRecord rec;
  rec.id = generateId();
  rec.name = name;
  rec.description = description;
  rec.mode = mode_;
  rec.waypoints = waypoints_;
  rec.geometry = geometry_;
  rec.distance_m = GeoUtils::pathDistance(geometry_);
  rec.duration_s = duration_s_;
  rec.base_route_id = base_route_id_;
  rec.geometry_fingerprint = GeoUtils::geometryFingerprint(geometry_);
  rec.created_at = stamp;
  rec.updated_at = stamp;
  return rec;
}

// <epoch-ms>-<9 base36 chars>
std::string RoutePlanner::generateId() {
  static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::uniform_int_distribution<int> pick(0, 35);
  std::string suffix(9, '0');
  for (auto &c : suffix)
    c = kAlphabet[pick(rng_)];
  return std::to_string(now_epoch_ms()) + "-" + suffix;
}

void to_json(Json &j, const RoutePlanner &planner) {
  j = Json{{"is_planning", planner.isPlanning()},
           {"mode", PlanningModeToString(planner.mode())},
           {"waypoints", planner.waypoints()},
           {"geometry", polyline_to_json(planner.geometry())},
           {"distance", planner.distance()},
           {"duration", planner.duration()},
           {"instructions", planner.instructions()},
           {"can_undo", planner.canUndo()},
           {"can_redo", planner.canRedo()},
           {"is_calculating", planner.isCalculating()}};
  if (!planner.baseRouteId().empty())
    j["base_route_id"] = planner.baseRouteId();
  if (planner.error().empty())
    j["error"] = nullptr;
  else
    j["error"] = planner.error();
}
