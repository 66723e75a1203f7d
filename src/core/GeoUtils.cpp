#include "core/GeoUtils.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>
#include <stdexcept>

double GeoUtils::haversine(double lat1, double lon1, double lat2, double lon2) {
  double phi1 = lat1 * (M_PI / 180);
  double phi2 = lat2 * (M_PI / 180);
  double delta_phi = (lat2 - lat1) * (M_PI / 180);
  double delta_gamma = (lon2 - lon1) * (M_PI / 180);
  double h = pow(sin(delta_phi / 2), 2) +
             cos(phi1) * cos(phi2) * pow(sin(delta_gamma / 2), 2);
  return 2 * kEarthRadiusM * atan2(sqrt(h), sqrt(1 - h));
}

double GeoUtils::haversine(const Coordinate &a, const Coordinate &b) {
  return haversine(a.latitude, a.longitude, b.latitude, b.longitude);
}

SegmentProjection GeoUtils::projectOntoSegment(const Coordinate &p,
                                               const Coordinate &a,
                                               const Coordinate &b) {
  const double px = p.longitude, py = p.latitude;
  const double x1 = a.longitude, y1 = a.latitude;
  const double dx = b.longitude - x1;
  const double dy = b.latitude - y1;

  if (dx == 0.0 && dy == 0.0)
    return {haversine(p, a), a};

  // t = 0 -> a, t = 1 -> b
  double t = ((px - x1) * dx + (py - y1) * dy) / (dx * dx + dy * dy);
  t = std::max(0.0, std::min(1.0, t));

  Coordinate closest{y1 + t * dy, x1 + t * dx};
  return {haversine(p, closest), closest};
}

NearestPoint GeoUtils::nearestPointOnPolyline(const Coordinate &p,
                                              const Polyline &line) {
  NearestPoint out;
  if (line.empty()) {
    out.closest = p;
    return out;
  }
  if (line.size() == 1) {
    out.distance = haversine(p, line.front());
    out.closest = line.front();
    return out;
  }

  out.closest = line.front();
  for (size_t i = 0; i + 1 < line.size(); ++i) {
    SegmentProjection proj = projectOntoSegment(p, line[i], line[i + 1]);
    // strict: keep the earliest segment on ties
    if (proj.distance < out.distance) {
      out.distance = proj.distance;
      out.closest = proj.closest;
      out.index = static_cast<int>(i);
    }
  }
  return out;
}

std::vector<double> GeoUtils::cumulativeDistances(const Polyline &line) {
  std::vector<double> cum;
  if (line.empty())
    return cum;
  cum.reserve(line.size());
  cum.push_back(0.0);
  for (size_t i = 1; i < line.size(); ++i)
    cum.push_back(cum[i - 1] + haversine(line[i - 1], line[i]));
  return cum;
}

double GeoUtils::pathDistance(const Polyline &line) {
  double total = 0.0;
  for (size_t i = 1; i < line.size(); ++i)
    total += haversine(line[i - 1], line[i]);
  return total;
}

double GeoUtils::distanceAlong(const NearestPoint &nearest,
                               const Polyline &line,
                               const std::vector<double> &cumulative) {
  if (line.empty() || cumulative.size() != line.size())
    return 0.0;
  const size_t idx =
      std::min(static_cast<size_t>(std::max(0, nearest.index)), line.size() - 1);
  return cumulative[idx] + haversine(line[idx], nearest.closest);
}

Coordinate GeoUtils::coordinateAtDistance(const Polyline &line, double target,
                                          const std::vector<double> &cumulative) {
  if (line.empty())
    throw std::invalid_argument("coordinateAtDistance: empty polyline");
  if (line.size() == 1 || target <= 0.0)
    return line.front();

  const std::vector<double> &cum =
      cumulative.size() == line.size() ? cumulative : cumulativeDistances(line);

  for (size_t i = 1; i < cum.size(); ++i) {
    if (cum[i] >= target) {
      const double seg = cum[i] - cum[i - 1];
      if (seg == 0.0)
        return line[i - 1];
      const double ratio = (target - cum[i - 1]) / seg;
      const Coordinate &s = line[i - 1];
      const Coordinate &e = line[i];
      return Coordinate{s.latitude + (e.latitude - s.latitude) * ratio,
                        s.longitude + (e.longitude - s.longitude) * ratio};
    }
  }
  return line.back();
}

Polyline GeoUtils::samplePath(const Polyline &line, double step_m) {
  if (line.size() < 2 || !(step_m > 0.0))
    return line;
  const auto cum = cumulativeDistances(line);
  const double total = cum.back();
  Polyline out;
  out.reserve(static_cast<size_t>(total / step_m) + 2);
  for (double d = 0.0; d < total; d += step_m)
    out.push_back(coordinateAtDistance(line, d, cum));
  out.push_back(line.back());
  return out;
}

GeoUtils::BBox GeoUtils::compute_bbox(const Polyline &pts) {
  GeoUtils::BBox b{+90, +180, -90, -180};
  for (auto &c : pts) {
    b.min_lat = std::min(b.min_lat, c.latitude);
    b.max_lat = std::max(b.max_lat, c.latitude);
    b.min_lon = std::min(b.min_lon, c.longitude);
    b.max_lon = std::max(b.max_lon, c.longitude);
  }
  return b;
}

static std::string to_hex(const uint8_t *p, size_t n) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < n; ++i)
    oss << std::setw(2) << (int)p[i];
  return oss.str();
}

static inline bool near_eq(double a, double b, double eps = 1e-7) {
  return std::abs(a - b) <= eps;
}

std::string GeoUtils::geometryFingerprint(const Polyline &line) {
  // 1) normalize geometry in forward order
  Polyline norm;
  norm.reserve(line.size());
  for (const auto &c : line) {
    double rlat = std::round(c.latitude * 1e6) / 1e6;
    double rlon = std::round(c.longitude * 1e6) / 1e6;
    if (norm.empty() || !near_eq(norm.back().latitude, rlat) ||
        !near_eq(norm.back().longitude, rlon))
      norm.push_back({rlat, rlon});
  }

  // 2) fingerprint payload: "v1|EPSG:4326|lat,lon;lat,lon;..."
  std::string csv;
  csv.reserve(norm.size() * 24);
  for (size_t i = 0; i < norm.size(); ++i) {
    if (i)
      csv.push_back(';');
    csv += std::to_string(norm[i].latitude);
    csv.push_back(',');
    csv += std::to_string(norm[i].longitude);
  }
  std::string material = "v1|EPSG:4326|" + csv;

  // 3) SHA-256
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  SHA256(reinterpret_cast<const unsigned char *>(material.data()),
         material.size(), digest.data());
  return to_hex(digest.data(), digest.size());
}
