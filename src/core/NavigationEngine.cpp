#include "core/NavigationEngine.hpp"
#include "core/GeoUtils.hpp"
#include <algorithm>
#include <iostream>

RouteStatus NavigationEngine::startNavigation(const RouteRecord &route) {
  if (route.geometry.size() < 2) {
    std::cerr << "[navigation] Route " << route.id
              << " has no usable geometry (" << route.geometry.size()
              << " points)" << std::endl;
    return RouteStatus::failure(RouteError::InvalidRoute,
                                "Route geometry needs at least two points");
  }

  stopNavigation();

  geometry_ = route.geometry;
  cumulative_ = GeoUtils::cumulativeDistances(geometry_);

  state_.status = NavigationStatus::Active;
  state_.route_id = route.id;
  state_.route_name = route.name;
  state_.total_distance =
      route.distance_m > 0.0 ? route.distance_m : cumulative_.back();
  state_.distance_remaining = state_.total_distance;

  std::cout << "[navigation] Started route " << route.id << " ("
            << geometry_.size() << " points, " << state_.total_distance
            << " m)" << std::endl;
  return RouteStatus::success();
}

UpdateOutcome NavigationEngine::onLocationUpdate(const LocationFix &fix) {
  if (state_.status != NavigationStatus::Active)
    return UpdateOutcome::Ignored;
  if (state_.has_location && fix.timestamp_ms == state_.last_fix_timestamp_ms)
    return UpdateOutcome::Ignored;

  state_.has_location = true;
  state_.current_location = fix.coord;
  state_.last_fix_timestamp_ms = fix.timestamp_ms;
  state_.has_speed = fix.has_speed;
  state_.current_speed = fix.has_speed ? std::max(0.0, fix.speed_mps) : 0.0;
  state_.has_heading = fix.has_heading;
  state_.heading_deg = fix.has_heading ? fix.heading_deg : 0.0;

  // position on route
  const NearestPoint np = GeoUtils::nearestPointOnPolyline(fix.coord, geometry_);
  state_.nearest_index = np.index;
  state_.distance_from_route = np.distance;

  const double traveled = GeoUtils::distanceAlong(np, geometry_, cumulative_);
  const double total = state_.total_distance;
  state_.distance_traveled = traveled;
  state_.distance_remaining = std::max(0.0, total - traveled);
  state_.progress_percent =
      total > 0.0 ? std::min(100.0, traveled / total * 100.0) : 0.0;

  // speed
  state_.smoothed_speed = smoother_.push(state_.current_speed);
  if (state_.current_speed > params_.stopped_speed_mps) {
    state_.has_eta = true;
    state_.eta_seconds = state_.distance_remaining / state_.current_speed;
  } else {
    state_.has_eta = false;
    state_.eta_seconds = 0.0;
  }

  // deviation
  const bool was_off = state_.is_off_route;
  state_.is_off_route = np.distance > params_.off_route_threshold_m;
  if (state_.is_off_route && !was_off)
    return UpdateOutcome::WentOffRoute;
  if (!state_.is_off_route && was_off)
    return UpdateOutcome::BackOnRoute;
  return UpdateOutcome::Updated;
}

RouteStatus NavigationEngine::pauseNavigation() {
  if (state_.status != NavigationStatus::Active)
    return RouteStatus::failure(RouteError::NotNavigating,
                                "Navigation is not active");
  state_.status = NavigationStatus::Paused;
  return RouteStatus::success();
}

RouteStatus NavigationEngine::resumeNavigation() {
  if (state_.status != NavigationStatus::Paused)
    return RouteStatus::failure(RouteError::NotNavigating,
                                "Navigation is not paused");
  state_.status = NavigationStatus::Active;
  return RouteStatus::success();
}

void NavigationEngine::stopNavigation() {
  if (state_.status != NavigationStatus::Idle)
    std::cout << "[navigation] Stopped route " << state_.route_id << std::endl;
  state_ = NavigationSnapshot{};
  geometry_.clear();
  cumulative_.clear();
  smoother_.reset();
}
