#pragma once
#include "core/RouteHistory.hpp"
#include "core/RoutingService.hpp"
#include "models/RouteModel.hpp"
#include "models/params.hpp"
#include <random>
#include <string>
#include <vector>

// A routing call staged by beginCalculation(). `session` ties the result
// back to the planning session that asked for it.
struct RouteRequest {
  std::vector<Coordinate> points;
  std::string profile;
  uint64_t session = 0;
  bool needs_router = false;
};

// Route planning state machine: NotPlanning -> Planning(mode) -> NotPlanning.
//
// Owns the route under construction (waypoints, geometry, bounded undo/redo
// history). Not thread-safe; all calls are expected from one thread.
// Validation failures come back as RouteStatus and leave state untouched.
class RoutePlanner {
public:
  // `router` may be null when only freeform planning is needed. Not owned.
  explicit RoutePlanner(RoutingService *router = nullptr,
                        PlanningParams params = PlanningParams{},
                        std::string profile = "bike");

  // ---- lifecycle ----
  void startPlanning(PlanningMode mode);
  void loadExistingRoute(const RouteRecord &route);
  void cancelPlanning();

  // ---- waypoints ----
  RouteStatus addWaypoint(const Coordinate &coord, const std::string &name = "");
  RouteStatus insertViaWaypoint(const Coordinate &coord, int index);
  RouteStatus removeWaypoint(const std::string &id);
  // Drag in progress: no history. finishMoveWaypoint() commits the gesture.
  RouteStatus moveWaypoint(const std::string &id, const Coordinate &coord);
  RouteStatus finishMoveWaypoint();
  RouteStatus reorderWaypoints(int from, int to);
  RouteStatus clearWaypoints();

  // ---- history ----
  void undo();
  void redo();
  bool canUndo() const { return history_.canUndo(); }
  bool canRedo() const { return history_.canRedo(); }
  const RouteHistory &history() const { return history_; }

  // ---- geometry ----
  // Blocking when a routing service is involved: beginCalculation, the
  // router call and complete/failCalculation in one go.
  RouteStatus calculateRoute();

  // Two-phase form for callers that drop their lock around the router call.
  // Freeform routes finish inside beginCalculation (needs_router stays
  // false). A second begin while one is outstanding is rejected with
  // CalculationInProgress.
  RouteStatus beginCalculation(RouteRequest &req);
  // Results for a session that was restarted or cancelled are discarded.
  RouteStatus completeCalculation(const RouteRequest &req,
                                  CalculatedRoute result);
  RouteStatus failCalculation(const RouteRequest &req,
                              const std::string &reason);
  RoutingService *router() const { return router_; }
  void setGeometry(const Polyline &geometry);

  RouteRecord prepareForSave(const std::string &name,
                             const std::string &description = "");

  void clearError() { error_.clear(); }

  // ---- state ----
  bool isPlanning() const { return planning_; }
  PlanningMode mode() const { return mode_; }
  const std::vector<Waypoint> &waypoints() const { return waypoints_; }
  const Polyline &geometry() const { return geometry_; }
  double distance() const { return distance_m_; }
  double duration() const { return duration_s_; }
  const std::vector<RouteInstruction> &instructions() const {
    return instructions_;
  }
  const std::string &baseRouteId() const { return base_route_id_; }
  bool isCalculating() const { return calculating_; }
  bool isMovePending() const { return move_pending_; }
  const std::string &error() const { return error_; }

private:
  RoutingService *router_;
  PlanningParams params_;
  std::string profile_;

  bool planning_ = false;
  PlanningMode mode_ = PlanningMode::PointToPoint;
  std::vector<Waypoint> waypoints_;
  Polyline geometry_;
  double distance_m_ = 0.0;
  double duration_s_ = 0.0;
  std::vector<RouteInstruction> instructions_;
  std::string base_route_id_;

  RouteHistory history_;
  bool move_pending_ = false;
  bool calculating_ = false;
  uint64_t session_ = 0;
  std::string error_;

  std::mt19937_64 rng_;

  void resetState();
  void pushHistory();
  void restore(const HistoryEntry &entry);
  RouteStatus requirePlanning() const;
  std::string generateId();
};

// Serialises the planner's observable state (for the HTTP layer).
void to_json(Json &j, const RoutePlanner &planner);
