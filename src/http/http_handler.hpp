#pragma once

#include "core/LocationProvider.hpp"
#include "core/NavigationController.hpp"
#include "core/RoutePlanner.hpp"
#include "core/RouteSegmentEditor.hpp"
#include "core/RouteStore.hpp"
#include <httplib.h>
#include <mutex>
#include <nlohmann/json.hpp>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
//
// Planner and editor calls are serialised here; httplib serves requests from
// a thread pool. `store` may be null when no database is configured.
class HttpHandler {
public:
  HttpHandler(RoutePlanner &planner, RouteSegmentEditor &editor,
              NavigationController &navigation,
              PushLocationProvider &locations, RouteStore *store)
      : planner_(planner), editor_(editor), navigation_(navigation),
        locations_(locations), store_(store) {}

  void callPostHandler(std::string action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

private:
  RoutePlanner &planner_;
  RouteSegmentEditor &editor_;
  NavigationController &navigation_;
  PushLocationProvider &locations_;
  RouteStore *store_;
  std::mutex plan_mutex_;
  std::mutex store_mutex_;

  // planning
  void handlePlanStart(const nlohmann::json &body, httplib::Response &res);
  void handlePlanLoad(const nlohmann::json &body, httplib::Response &res);
  void handleWaypoint(const std::string &op, const nlohmann::json &body,
                      httplib::Response &res);
  void handleCalculate(httplib::Response &res);
  void handlePress(const std::string &op, const nlohmann::json &body,
                   httplib::Response &res);

  // saved routes
  void handleRouteSave(const nlohmann::json &body, httplib::Response &res);
  void handleRouteDelete(const nlohmann::json &body, httplib::Response &res);
  void handleRoutesList(httplib::Response &res);
  void handleRouteGet(const httplib::Request &req, httplib::Response &res);
  void handleRouteGpx(const httplib::Request &req, httplib::Response &res);

  // navigation
  void handleNavStart(const nlohmann::json &body, httplib::Response &res);
  void handleNavLocation(const nlohmann::json &body, httplib::Response &res);
  void handleNavStatus(httplib::Response &res);

  void sendPlannerState(const RouteStatus &st, httplib::Response &res);
  bool requireStore(httplib::Response &res);
};
