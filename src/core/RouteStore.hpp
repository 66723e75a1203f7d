#pragma once
#include "models/RouteModel.hpp"
#include <string>
#include <vector>

// Saved-route persistence. Storage errors are thrown as std::runtime_error.
class RouteStore {
public:
  virtual ~RouteStore() = default;
  virtual void begin() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;

  // Insert a new record (id supplied by the planner).
  virtual void save_route(const RouteRecord &route) = 0;

  // Replace waypoints/geometry/metadata of an existing id. Returns false when
  // the id is unknown.
  virtual bool update_route(const RouteRecord &route) = 0;

  // Returns false when the id is unknown.
  virtual bool load_route(const std::string &id, RouteRecord &out) = 0;

  virtual std::vector<RouteSummary> list_routes() = 0;

  virtual bool delete_route(const std::string &id) = 0;
};
