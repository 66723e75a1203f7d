// Entry point for the route planning / navigation HTTP server.  It loads
// configuration, wires the planner, navigation controller and stores, and
// exposes the REST endpoints handled by `HttpHandler`.

#include "core/LocationProvider.hpp"
#include "core/NavigationController.hpp"
#include "core/RoutePlanner.hpp"
#include "core/RouteSegmentEditor.hpp"
#include "http/http_handler.hpp"
#include "infra/MySQLRouteStore.hpp"
#include "infra/OsrmRoutingClient.hpp"
#include "models/params.hpp"

#include <cstdlib>
#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <signal.h>
#include <unistd.h>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

// DB_HOST / DB_PORT / DB_USER / DB_PASS / DB_NAME win over settings.json
static void apply_db_env(MySQLParams &p) {
  const char *host = std::getenv("DB_HOST");
  const char *port = std::getenv("DB_PORT");
  if (host || port) {
    std::string h = "127.0.0.1", pt = "3306";
    std::string rest = p.uri;
    if (auto pos = rest.find("://"); pos != std::string::npos)
      rest = rest.substr(pos + 3);
    if (auto c = rest.find(':'); c != std::string::npos) {
      h = rest.substr(0, c);
      pt = rest.substr(c + 1);
    } else if (!rest.empty()) {
      h = rest;
    }
    if (host)
      h = host;
    if (port)
      pt = port;
    p.uri = "tcp://" + h + ":" + pt;
  }
  if (const char *v = std::getenv("DB_USER"))
    p.user = v;
  if (const char *v = std::getenv("DB_PASS"))
    p.password = v;
  if (const char *v = std::getenv("DB_NAME"))
    p.schema = v;
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  std::ifstream cfg(cfg_path);
  if (!cfg) {
    std::cerr << "[main] Cannot open " << cfg_path << "\n";
    return 1;
  }
  EngineSettings settings;
  try {
    json raw;
    cfg >> raw;
    settings = EngineSettings::from_json(raw);
  } catch (const std::exception &e) {
    std::cerr << "[main] Invalid settings: " << e.what() << "\n";
    return 1;
  }
  apply_db_env(settings.mysql);
  std::cout << "[main] Starting server on port " << settings.server.port
            << std::endl;

  // ---------------------- Components --------------------------------------
  OsrmRoutingClient router(settings.routing);
  RoutePlanner planner(&router, settings.planning, settings.routing.profile);
  RouteSegmentEditor editor(planner, settings.planning.press_threshold_m);
  PushLocationProvider locations;
  NavigationController navigation(locations, settings.navigation);

  // ---------------------- Database connection -----------------------------
  std::unique_ptr<MySQLRouteStore> store;
  try {
    store = std::make_unique<MySQLRouteStore>(
        settings.mysql.uri, settings.mysql.user, settings.mysql.password,
        settings.mysql.schema);
    std::cout << "[main] Connected to " << settings.mysql.uri << "/"
              << settings.mysql.schema << std::endl;
  } catch (const std::exception &e) {
    // planning and navigation still work without saved routes
    std::cerr << "[main] Route store unavailable: " << e.what() << "\n";
  }

  HttpHandler handler(planner, editor, navigation, locations, store.get());

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 16ull); // 16MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &path : settings.server.post_endpoints) {
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST " << action << "] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &path : settings.server.get_endpoints) {
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callGetHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[GET " << action << "] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", settings.server.port)) {
    std::cerr << "[main] Failed to listen on port " << settings.server.port
              << "\n";
    return 1;
  }
  navigation.stop();
  return 0;
}
