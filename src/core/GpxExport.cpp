#include "core/GpxExport.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace {
const char *kCreator = "routenav";

const char *waypointSymbol(WaypointKind kind) {
  switch (kind) {
  case WaypointKind::Start:
    return "Flag, Green";
  case WaypointKind::End:
    return "Flag, Red";
  default:
    return "Waypoint";
  }
}
} // namespace

std::string escapeXml(const std::string &in) {
  std::string out;
  out.reserve(in.size());
  for (char c : in) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&apos;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string routeToGpx(const RouteRecord &route, const std::string &now_iso) {
  const std::string mode = PlanningModeToString(route.mode);

  std::ostringstream x;
  x << std::fixed << std::setprecision(7);
  x << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    << "<gpx version=\"1.1\" creator=\"" << kCreator << "\"\n"
    << "  xmlns=\"http://www.topografix.com/GPX/1/1\"\n"
    << "  xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\"\n"
    << "  xsi:schemaLocation=\"http://www.topografix.com/GPX/1/1 "
       "http://www.topografix.com/GPX/1/1/gpx.xsd\">\n";

  x << "  <metadata>\n"
    << "    <name>" << escapeXml(route.name) << "</name>\n";
  if (!route.description.empty())
    x << "    <desc>" << escapeXml(route.description) << "</desc>\n";
  x << "    <time>" << escapeXml(now_iso) << "</time>\n"
    << "    <keywords>bike, cycling, tour, " << escapeXml(mode)
    << "</keywords>\n"
    << "  </metadata>\n";

  for (const auto &wp : route.waypoints) {
    x << "  <wpt lat=\"" << wp.coord.latitude << "\" lon=\""
      << wp.coord.longitude << "\">\n";
    if (!wp.name.empty())
      x << "    <name>" << escapeXml(wp.name) << "</name>\n";
    x << "    <desc>" << WaypointKindToString(wp.kind) << " waypoint</desc>\n"
      << "    <sym>" << waypointSymbol(wp.kind) << "</sym>\n"
      << "  </wpt>\n";
  }

  x << "  <trk>\n"
    << "    <name>" << escapeXml(route.name) << "</name>\n"
    << "    <type>" << escapeXml(mode) << "</type>\n"
    << "    <trkseg>\n";
  for (const auto &c : route.geometry)
    x << "      <trkpt lat=\"" << c.latitude << "\" lon=\"" << c.longitude
      << "\"/>\n";
  x << "    </trkseg>\n"
    << "  </trk>\n"
    << "</gpx>\n";
  return x.str();
}

std::string gpxFileName(const std::string &route_name, int64_t epoch_ms) {
  std::string safe;
  for (char c : route_name) {
    if (safe.size() == 50)
      break;
    const unsigned char uc = static_cast<unsigned char>(c);
    safe += (std::isalnum(uc) || c == '-' || c == '_') ? c : '_';
  }
  return safe + "_" + std::to_string(epoch_ms) + ".gpx";
}
