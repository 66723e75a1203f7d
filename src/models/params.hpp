#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// External routing service settings.
struct RoutingParams {
  std::string base_url = "https://router.project-osrm.org";
  std::string profile = "bike";
  int timeout_s = 15;

  static RoutingParams from_json(const nlohmann::json &j) {
    RoutingParams p;
    if (j.contains("base_url"))
      p.base_url = j.at("base_url").get<std::string>();
    if (j.contains("profile"))
      p.profile = j.at("profile").get<std::string>();
    if (j.contains("timeout_s"))
      p.timeout_s = j.at("timeout_s").get<int>();
    return p;
  }
};

// Live navigation tuning.
struct NavigationParams {
  double off_route_threshold_m = 50.0;
  double stopped_speed_mps = 0.5; // at or below: no ETA
  std::size_t channel_capacity = 256;

  static NavigationParams from_json(const nlohmann::json &j) {
    NavigationParams p;
    if (j.contains("off_route_threshold_m"))
      p.off_route_threshold_m = j.at("off_route_threshold_m").get<double>();
    if (j.contains("stopped_speed_mps"))
      p.stopped_speed_mps = j.at("stopped_speed_mps").get<double>();
    if (j.contains("channel_capacity"))
      p.channel_capacity = j.at("channel_capacity").get<std::size_t>();
    return p;
  }
};

// Route planning tuning.
struct PlanningParams {
  std::size_t max_history = 50;
  double press_threshold_m = 50.0;

  static PlanningParams from_json(const nlohmann::json &j) {
    PlanningParams p;
    if (j.contains("max_history"))
      p.max_history = j.at("max_history").get<std::size_t>();
    if (j.contains("press_threshold_m"))
      p.press_threshold_m = j.at("press_threshold_m").get<double>();
    return p;
  }
};

struct MySQLParams {
  std::string uri = "tcp://127.0.0.1:3306";
  std::string user = "routenav_user";
  std::string password = "changeme-user";
  std::string schema = "routenav";

  static MySQLParams from_json(const nlohmann::json &j) {
    MySQLParams p;
    if (j.contains("uri"))
      p.uri = j.at("uri").get<std::string>();
    if (j.contains("user"))
      p.user = j.at("user").get<std::string>();
    if (j.contains("password"))
      p.password = j.at("password").get<std::string>();
    if (j.contains("schema"))
      p.schema = j.at("schema").get<std::string>();
    return p;
  }
};

struct ServerParams {
  int port = 5005;
  std::vector<std::string> post_endpoints;
  std::vector<std::string> get_endpoints;

  static ServerParams from_json(const nlohmann::json &j) {
    ServerParams p;
    p.port = j.value("port", 5005);
    if (j.contains("post_endpoints"))
      p.post_endpoints = j.at("post_endpoints").get<std::vector<std::string>>();
    if (j.contains("get_endpoints"))
      p.get_endpoints = j.at("get_endpoints").get<std::vector<std::string>>();
    return p;
  }
};

// Everything read from config/settings.json. Missing sections keep defaults.
struct EngineSettings {
  ServerParams server;
  RoutingParams routing;
  NavigationParams navigation;
  PlanningParams planning;
  MySQLParams mysql;

  static EngineSettings from_json(const nlohmann::json &j) {
    EngineSettings s;
    if (j.contains("server"))
      s.server = ServerParams::from_json(j.at("server"));
    if (j.contains("routing"))
      s.routing = RoutingParams::from_json(j.at("routing"));
    if (j.contains("navigation"))
      s.navigation = NavigationParams::from_json(j.at("navigation"));
    if (j.contains("planning"))
      s.planning = PlanningParams::from_json(j.at("planning"));
    if (j.contains("mysql"))
      s.mysql = MySQLParams::from_json(j.at("mysql"));
    return s;
  }
};
