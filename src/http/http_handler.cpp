#include "http_handler.hpp"
#include "core/Formatters.hpp"
#include "core/GpxExport.hpp"
#include "core/TimeUtils.hpp"

#include <iostream>

using json = nlohmann::json;

static int http_status_for(RouteError e) {
  switch (e) {
  case RouteError::None:
    return 200;
  case RouteError::NotPlanning:
  case RouteError::NotNavigating:
  case RouteError::CalculationInProgress:
    return 409;
  case RouteError::WaypointNotFound:
    return 404;
  case RouteError::RoutingFailed:
    return 502;
  case RouteError::LocationUnavailable:
    return 503;
  default:
    return 400;
  }
}

static void send_json(httplib::Response &res, const json &j, int status = 200) {
  res.status = status;
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_content(j.dump(), "application/json");
}

static void send_error(httplib::Response &res, int status,
                       const std::string &error, const std::string &message) {
  send_json(res, json{{"ok", false}, {"error", error}, {"message", message}},
            status);
}

// ===== routes =====

void HttpHandler::callPostHandler(std::string action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  json body = json::object();
  if (!req.body.empty()) {
    try {
      body = json::parse(req.body);
    } catch (const std::exception &e) {
      send_error(res, 400, "invalid_json", e.what());
      return;
    }
  }

  try {
    if (action == "plan/start") {
      handlePlanStart(body, res);
    } else if (action == "plan/cancel") {
      std::lock_guard<std::mutex> lock(plan_mutex_);
      editor_.cancel();
      planner_.cancelPlanning();
      sendPlannerState(RouteStatus::success(), res);
    } else if (action == "plan/load") {
      handlePlanLoad(body, res);
    } else if (action == "plan/undo") {
      std::lock_guard<std::mutex> lock(plan_mutex_);
      planner_.undo();
      sendPlannerState(RouteStatus::success(), res);
    } else if (action == "plan/redo") {
      std::lock_guard<std::mutex> lock(plan_mutex_);
      planner_.redo();
      sendPlannerState(RouteStatus::success(), res);
    } else if (action == "plan/clear-error") {
      std::lock_guard<std::mutex> lock(plan_mutex_);
      planner_.clearError();
      sendPlannerState(RouteStatus::success(), res);
    } else if (action.rfind("waypoint/", 0) == 0) {
      handleWaypoint(action.substr(9), body, res);
    } else if (action == "route/calculate") {
      handleCalculate(res);
    } else if (action == "route/save") {
      handleRouteSave(body, res);
    } else if (action == "route/delete") {
      handleRouteDelete(body, res);
    } else if (action == "press" || action.rfind("press/", 0) == 0) {
      handlePress(action == "press" ? "" : action.substr(6), body, res);
    } else if (action == "nav/start") {
      handleNavStart(body, res);
    } else if (action == "nav/location") {
      handleNavLocation(body, res);
    } else if (action == "nav/pause") {
      RouteStatus st = navigation_.pause();
      send_json(res, st, http_status_for(st.error));
    } else if (action == "nav/resume") {
      RouteStatus st = navigation_.resume();
      send_json(res, st, http_status_for(st.error));
    } else if (action == "nav/stop") {
      navigation_.stop();
      send_json(res, RouteStatus::success());
    } else {
      res.status = 404;
      res.set_content("Unknown action: " + action, "text/plain");
    }
  } catch (const json::exception &e) {
    // missing or mistyped request fields
    send_error(res, 400, "bad_request", e.what());
  }
}

void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "plan") {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    sendPlannerState(RouteStatus::success(), res);
  } else if (action == "routes") {
    handleRoutesList(res);
  } else if (action == "route") {
    handleRouteGet(req, res);
  } else if (action == "route/gpx") {
    handleRouteGpx(req, res);
  } else if (action == "nav/status") {
    handleNavStatus(res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// ===== planning =====

// Caller holds plan_mutex_.
void HttpHandler::sendPlannerState(const RouteStatus &st,
                                   httplib::Response &res) {
  json out = st;
  out["planner"] = planner_;
  if (editor_.hasPending()) {
    const SegmentMatch &m = editor_.pending();
    out["pending_insert"] = {{"segment_index", m.segment_index},
                             {"insert_at_index", m.insert_at_index},
                             {"distance_to_route", m.distance_to_route},
                             {"coordinate", m.nearest_coordinate}};
  }
  send_json(res, out, http_status_for(st.error));
}

void HttpHandler::handlePlanStart(const json &body, httplib::Response &res) {
  const PlanningMode mode =
      PlanningModeFromString(body.value("mode", std::string("point-to-point")));
  std::lock_guard<std::mutex> lock(plan_mutex_);
  editor_.cancel();
  planner_.startPlanning(mode);
  sendPlannerState(RouteStatus::success(), res);
}

void HttpHandler::handlePlanLoad(const json &body, httplib::Response &res) {
  if (!requireStore(res))
    return;
  const std::string id = body.at("id").get<std::string>();

  RouteRecord rec;
  bool found = false;
  {
    std::lock_guard<std::mutex> lock(store_mutex_);
    found = store_->load_route(id, rec);
  }
  if (!found) {
    send_error(res, 404, "not_found", "No saved route with id " + id);
    return;
  }

  std::lock_guard<std::mutex> lock(plan_mutex_);
  editor_.cancel();
  planner_.loadExistingRoute(rec);
  sendPlannerState(RouteStatus::success(), res);
}

void HttpHandler::handleWaypoint(const std::string &op, const json &body,
                                 httplib::Response &res) {
  std::lock_guard<std::mutex> lock(plan_mutex_);
  RouteStatus st;
  if (op == "add") {
    st = planner_.addWaypoint(body.get<Coordinate>(),
                              body.value("name", std::string()));
  } else if (op == "insert") {
    st = planner_.insertViaWaypoint(body.get<Coordinate>(),
                                    body.at("index").get<int>());
  } else if (op == "remove") {
    st = planner_.removeWaypoint(body.at("id").get<std::string>());
  } else if (op == "move") {
    st = planner_.moveWaypoint(body.at("id").get<std::string>(),
                               body.get<Coordinate>());
  } else if (op == "move/finish") {
    st = planner_.finishMoveWaypoint();
  } else if (op == "reorder") {
    st = planner_.reorderWaypoints(body.at("from").get<int>(),
                                   body.at("to").get<int>());
  } else if (op == "clear") {
    st = planner_.clearWaypoints();
  } else {
    res.status = 404;
    res.set_content("Unknown waypoint action: " + op, "text/plain");
    return;
  }
  // any structural edit invalidates a pending press preview
  if (op != "move")
    editor_.cancel();
  sendPlannerState(st, res);
}

// plan_mutex_ is released for the router round trip so other planning
// requests still see is_calculating.
void HttpHandler::handleCalculate(httplib::Response &res) {
  RouteRequest req;
  RoutingService *router = nullptr;
  {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    RouteStatus st = planner_.beginCalculation(req);
    if (!st.ok() || !req.needs_router) {
      sendPlannerState(st, res);
      return;
    }
    router = planner_.router();
  }

  CalculatedRoute result;
  bool failed = false;
  std::string reason;
  try {
    result = router->calculate(req.points, req.profile);
  } catch (const std::exception &e) {
    failed = true;
    reason = e.what();
  }

  std::lock_guard<std::mutex> lock(plan_mutex_);
  RouteStatus st = failed ? planner_.failCalculation(req, reason)
                          : planner_.completeCalculation(req, std::move(result));
  sendPlannerState(st, res);
}

void HttpHandler::handlePress(const std::string &op, const json &body,
                              httplib::Response &res) {
  std::lock_guard<std::mutex> lock(plan_mutex_);
  if (op.empty()) {
    if (!planner_.isPlanning()) {
      sendPlannerState(RouteStatus::failure(RouteError::NotPlanning,
                                            "Route planning is not active"),
                       res);
      return;
    }
    SegmentMatch m = editor_.handlePress(body.get<Coordinate>());
    json out = {{"ok", true}, {"found", m.found()}};
    if (m.found()) {
      out["segment_index"] = m.segment_index;
      out["insert_at_index"] = m.insert_at_index;
      out["nearest_geometry_index"] = m.nearest_geometry_index;
      out["distance_to_route"] = m.distance_to_route;
      out["coordinate"] = m.nearest_coordinate;
    }
    send_json(res, out);
  } else if (op == "confirm") {
    sendPlannerState(editor_.confirm(), res);
  } else if (op == "cancel") {
    editor_.cancel();
    sendPlannerState(RouteStatus::success(), res);
  } else {
    res.status = 404;
    res.set_content("Unknown press action: " + op, "text/plain");
  }
}

// ===== saved routes =====

bool HttpHandler::requireStore(httplib::Response &res) {
  if (store_)
    return true;
  send_error(res, 503, "store_unavailable", "Route storage is not configured");
  return false;
}

void HttpHandler::handleRouteSave(const json &body, httplib::Response &res) {
  if (!requireStore(res))
    return;

  RouteRecord rec;
  {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    if (planner_.geometry().size() < 2) {
      send_error(res, 400, RouteErrorToString(RouteError::InvalidRoute),
                 "Calculate the route before saving");
      return;
    }
    rec = planner_.prepareForSave(body.at("name").get<std::string>(),
                                  body.value("description", std::string()));
  }

  // "update": overwrite the route being modified instead of adding a copy
  const bool update = body.value("update", false) && !rec.base_route_id.empty();
  if (update)
    rec.id = rec.base_route_id;

  bool stored = true;
  {
    std::lock_guard<std::mutex> lock(store_mutex_);
    store_->begin();
    try {
      if (update)
        stored = store_->update_route(rec);
      else
        store_->save_route(rec);
      store_->commit();
    } catch (const std::exception &e) {
      std::cerr << "[HttpHandler] save failed: " << e.what() << "\n";
      store_->rollback();
      throw;
    }
  }
  if (!stored) {
    send_error(res, 404, "not_found", "No saved route with id " + rec.id);
    return;
  }

  std::cout << "[HttpHandler] Saved route " << rec.id << " (" << rec.name
            << ")" << std::endl;
  send_json(res, json{{"ok", true}, {"route", rec}});
}

void HttpHandler::handleRouteDelete(const json &body, httplib::Response &res) {
  if (!requireStore(res))
    return;
  const std::string id = body.at("id").get<std::string>();

  bool deleted = false;
  {
    std::lock_guard<std::mutex> lock(store_mutex_);
    store_->begin();
    try {
      deleted = store_->delete_route(id);
      store_->commit();
    } catch (const std::exception &e) {
      std::cerr << "[HttpHandler] delete failed: " << e.what() << "\n";
      store_->rollback();
      throw;
    }
  }
  if (!deleted) {
    send_error(res, 404, "not_found", "No saved route with id " + id);
    return;
  }
  send_json(res, json{{"ok", true}, {"id", id}});
}

void HttpHandler::handleRoutesList(httplib::Response &res) {
  if (!requireStore(res))
    return;
  std::vector<RouteSummary> routes;
  {
    std::lock_guard<std::mutex> lock(store_mutex_);
    routes = store_->list_routes();
  }
  send_json(res, json{{"ok", true}, {"routes", routes}});
}

void HttpHandler::handleRouteGet(const httplib::Request &req,
                                 httplib::Response &res) {
  if (!requireStore(res))
    return;
  if (!req.has_param("id")) {
    send_error(res, 400, "bad_request", "missing id");
    return;
  }
  const std::string id = req.get_param_value("id");

  RouteRecord rec;
  bool found = false;
  {
    std::lock_guard<std::mutex> lock(store_mutex_);
    found = store_->load_route(id, rec);
  }
  if (!found) {
    send_error(res, 404, "not_found", "No saved route with id " + id);
    return;
  }
  send_json(res, json{{"ok", true}, {"route", rec}});
}

void HttpHandler::handleRouteGpx(const httplib::Request &req,
                                 httplib::Response &res) {
  if (!requireStore(res))
    return;
  if (!req.has_param("id")) {
    send_error(res, 400, "bad_request", "missing id");
    return;
  }
  const std::string id = req.get_param_value("id");

  RouteRecord rec;
  bool found = false;
  {
    std::lock_guard<std::mutex> lock(store_mutex_);
    found = store_->load_route(id, rec);
  }
  if (!found) {
    send_error(res, 404, "not_found", "No saved route with id " + id);
    return;
  }

  const int64_t now = now_epoch_ms();
  res.set_header("Content-Disposition",
                 "attachment; filename=\"" + gpxFileName(rec.name, now) + "\"");
  res.set_content(routeToGpx(rec, iso8601_utc(now)), "application/gpx+xml");
}

// ===== navigation =====

void HttpHandler::handleNavStart(const json &body, httplib::Response &res) {
  RouteRecord rec;
  if (body.contains("id")) {
    if (!requireStore(res))
      return;
    const std::string id = body.at("id").get<std::string>();
    bool found = false;
    {
      std::lock_guard<std::mutex> lock(store_mutex_);
      found = store_->load_route(id, rec);
    }
    if (!found) {
      send_error(res, 404, "not_found", "No saved route with id " + id);
      return;
    }
  } else {
    // navigate the route currently on the planner
    std::lock_guard<std::mutex> lock(plan_mutex_);
    rec = planner_.prepareForSave(body.value("name", std::string("Current route")));
  }

  RouteStatus st = navigation_.start(rec);
  json out = st;
  if (st.ok())
    out["status"] = *navigation_.snapshot();
  send_json(res, out, http_status_for(st.error));
}

void HttpHandler::handleNavLocation(const json &body, httplib::Response &res) {
  LocationFix fix = body.get<LocationFix>();
  if (fix.timestamp_ms == 0)
    fix.timestamp_ms = now_epoch_ms();

  if (!navigation_.isRunning()) {
    RouteStatus st = RouteStatus::failure(RouteError::NotNavigating,
                                          "Navigation is not running");
    send_json(res, st, http_status_for(st.error));
    return;
  }
  const std::size_t delivered = locations_.publish(fix);
  send_json(res, json{{"ok", true}, {"delivered", delivered}});
}

void HttpHandler::handleNavStatus(httplib::Response &res) {
  auto snap = navigation_.snapshot();
  send_json(res, json{{"status", *snap}, {"view", buildViewModel(*snap)}});
}
