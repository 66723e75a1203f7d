#pragma once
#include "models/RouteModel.hpp"
#include <cstdint>
#include <string>

// GPX 1.1 export of a saved route: metadata, one <wpt> per waypoint and a
// single track segment holding the geometry.
std::string routeToGpx(const RouteRecord &route, const std::string &now_iso);

// & < > " ' -> entities
std::string escapeXml(const std::string &in);

// "<name with [^A-Za-z0-9_-] replaced by _, max 50 chars>_<epoch_ms>.gpx"
std::string gpxFileName(const std::string &route_name, int64_t epoch_ms);
