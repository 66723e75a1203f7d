#pragma once
#include "core/SpeedSmoother.hpp"
#include "models/NavigationModel.hpp"
#include "models/RouteModel.hpp"
#include "models/params.hpp"
#include <vector>

// One live navigation session: Idle -> Active <-> Paused -> Idle.
//
// Single-writer and lock-free; NavigationController serialises access when
// fixes arrive from another thread.
class NavigationEngine {
public:
  explicit NavigationEngine(NavigationParams params = NavigationParams{})
      : params_(params) {}

  // InvalidRoute when the geometry has fewer than two points. Replaces any
  // running session.
  RouteStatus startNavigation(const RouteRecord &route);

  // Ignored while idle or paused, and for a repeated timestamp.
  UpdateOutcome onLocationUpdate(const LocationFix &fix);

  // NotNavigating unless Active (pause) / Paused (resume).
  RouteStatus pauseNavigation();
  RouteStatus resumeNavigation();

  void stopNavigation();

  NavigationStatus status() const { return state_.status; }
  bool isActive() const { return state_.status == NavigationStatus::Active; }
  // Copy of the session; `sequence` is left at 0.
  NavigationSnapshot snapshot() const { return state_; }

  const Polyline &geometry() const { return geometry_; }
  const std::vector<double> &cumulative() const { return cumulative_; }
  const NavigationParams &params() const { return params_; }

private:
  NavigationParams params_;
  NavigationSnapshot state_;
  Polyline geometry_;
  std::vector<double> cumulative_;
  SpeedSmoother smoother_;
};
