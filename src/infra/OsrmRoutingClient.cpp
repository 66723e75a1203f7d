#include "infra/OsrmRoutingClient.hpp"
#include "models/OsrmResponse.hpp"

#include <httplib.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

OsrmRoutingClient::OsrmRoutingClient(RoutingParams params)
    : params_(std::move(params)) {}

std::string
OsrmRoutingClient::buildRoutePath(const std::vector<Coordinate> &points,
                                  const std::string &profile) {
  std::ostringstream p;
  p << "/route/v1/" << profile << "/";
  p << std::fixed << std::setprecision(6);
  for (size_t i = 0; i < points.size(); ++i) {
    if (i)
      p << ';';
    p << points[i].longitude << ',' << points[i].latitude;
  }
  p << "?overview=full&geometries=geojson&steps=true&alternatives=false";
  return p.str();
}

CalculatedRoute OsrmRoutingClient::parseRouteResponse(int status,
                                                      const std::string &body) {
  // OSRM reports errors as JSON too; keep its code/message when present
  Json j = Json::parse(body, nullptr, false);
  if (status != 200) {
    std::string detail;
    if (!j.is_discarded() && j.is_object())
      detail = j.value("code", std::string{}) + " " +
               j.value("message", std::string{});
    throw std::runtime_error("OSRM HTTP " + std::to_string(status) +
                             (detail.empty() ? "" : ": " + detail));
  }
  if (j.is_discarded())
    throw std::runtime_error("OSRM returned invalid JSON");

  OsrmRouteResponse osrm = j.get<OsrmRouteResponse>();
  return to_calculated_route(osrm);
}

CalculatedRoute OsrmRoutingClient::calculate(
    const std::vector<Coordinate> &points, const std::string &profile) {
  if (points.size() < 2)
    throw std::runtime_error("OSRM needs at least two coordinates");

  const std::string path =
      buildRoutePath(points, profile.empty() ? params_.profile : profile);

  httplib::Client cli(params_.base_url);
  cli.set_connection_timeout(params_.timeout_s, 0);
  cli.set_read_timeout(params_.timeout_s, 0);

  std::cout << "[OsrmRoutingClient] GET " << params_.base_url << path
            << std::endl;
  auto res = cli.Get(path);
  if (!res)
    throw std::runtime_error("OSRM request failed: " +
                             httplib::to_string(res.error()));

  return parseRouteResponse(res->status, res->body);
}
