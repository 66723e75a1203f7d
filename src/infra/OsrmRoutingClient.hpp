#pragma once
#include "core/RoutingService.hpp"
#include "models/params.hpp"
#include <string>
#include <vector>

// RoutingService backed by the OSRM HTTP /route service.
class OsrmRoutingClient : public RoutingService {
public:
  explicit OsrmRoutingClient(RoutingParams params);

  // Empty `profile` falls back to the configured one.
  CalculatedRoute calculate(const std::vector<Coordinate> &points,
                            const std::string &profile) override;

  // /route/v1/{profile}/{lon,lat;...}?overview=full&geometries=geojson&...
  static std::string buildRoutePath(const std::vector<Coordinate> &points,
                                    const std::string &profile);

  // Throws std::runtime_error for a non-200 status or an unusable body.
  static CalculatedRoute parseRouteResponse(int status,
                                            const std::string &body);

private:
  RoutingParams params_;
};
