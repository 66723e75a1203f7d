#include "core/Formatters.hpp"
#include <cmath>
#include <cstdio>

namespace fmt_utils {

double mpsToKmh(double mps) { return mps * 3.6; }

static std::string fixed1(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.1f", v);
  return buf;
}

std::string formatDistance(double meters) {
  if (meters < 1000.0)
    return std::to_string(static_cast<long long>(std::floor(meters + 0.5))) +
           " m";
  return fixed1(meters / 1000.0) + " km";
}

std::string formatDuration(double seconds) {
  const long long total = static_cast<long long>(std::floor(seconds));
  const long long hours = total / 3600;
  const long long minutes = (total % 3600) / 60;
  if (hours == 0)
    return std::to_string(minutes) + " min";
  return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

std::string formatSpeed(double mps) { return fixed1(mpsToKmh(mps)) + " km/h"; }

std::string formatTimeRemaining(std::optional<double> seconds) {
  if (!seconds)
    return "--:--";
  return formatDuration(*seconds);
}

std::optional<double> estimateTimeRemaining(double distance_remaining_m,
                                            double speed_mps,
                                            double stopped_mps) {
  if (speed_mps <= stopped_mps)
    return std::nullopt;
  return distance_remaining_m / speed_mps;
}

} // namespace fmt_utils

NavigationViewModel buildViewModel(const NavigationSnapshot &snap) {
  using namespace fmt_utils;
  NavigationViewModel vm;
  vm.is_navigating = snap.status != NavigationStatus::Idle;
  vm.is_paused = snap.status == NavigationStatus::Paused;
  vm.is_off_route = snap.is_off_route;
  vm.route_name = snap.route_name;
  vm.speed_kmh = mpsToKmh(snap.smoothed_speed);
  vm.speed = formatSpeed(snap.smoothed_speed);
  vm.distance_traveled = formatDistance(snap.distance_traveled);
  vm.distance_remaining = formatDistance(snap.distance_remaining);
  vm.time_remaining = formatTimeRemaining(
      snap.has_eta ? std::optional<double>(snap.eta_seconds) : std::nullopt);
  vm.progress_percent = snap.progress_percent;
  vm.distance_from_route = snap.distance_from_route;
  return vm;
}
