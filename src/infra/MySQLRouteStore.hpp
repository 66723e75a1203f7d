#pragma once
#include "core/RouteStore.hpp"
#include <mysql/mysql.h>

// RouteStore over the MySQL C API. Tables: custom_routes, route_waypoints,
// route_geometry (see config/schema.sql). Not thread-safe; one connection.
class MySQLRouteStore final : public RouteStore {
public:
  MySQLRouteStore(const std::string &uri, const std::string &user,
                  const std::string &pass, const std::string &schema);
  ~MySQLRouteStore();

  MySQLRouteStore(const MySQLRouteStore &) = delete;
  MySQLRouteStore &operator=(const MySQLRouteStore &) = delete;

  void begin() override;
  void commit() override;
  void rollback() override;

  void save_route(const RouteRecord &route) override;
  bool update_route(const RouteRecord &route) override;
  bool load_route(const std::string &id, RouteRecord &out) override;
  std::vector<RouteSummary> list_routes() override;
  bool delete_route(const std::string &id) override;

private:
  MYSQL *conn_ = nullptr;

  bool exists(const std::string &id);
  void insert_children(const RouteRecord &route);
  void delete_children(const std::string &id);
};
