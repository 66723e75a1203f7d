#include "core/NavigationController.hpp"
#include <iostream>

NavigationController::NavigationController(LocationProvider &provider,
                                           NavigationParams params)
    : provider_(provider), engine_(params), channel_(params.channel_capacity),
      snapshot_(std::make_shared<const NavigationSnapshot>()) {}

NavigationController::~NavigationController() { stop(); }

RouteStatus NavigationController::start(const RouteRecord &route) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  stopLocked();

  RouteStatus st = engine_.startNavigation(route);
  if (!st.ok())
    return st;

  channel_.reset();
  subscription_ = provider_.subscribe([this](const LocationFix &fix) {
    channel_.push(NavigationEvent::location(fix));
  });
  if (subscription_ < 0) {
    std::cerr << "[navigation] Location provider refused subscription"
              << std::endl;
    engine_.stopNavigation();
    publish();
    return RouteStatus::failure(RouteError::LocationUnavailable,
                                "Location updates are unavailable");
  }

  publish();
  running_ = true;
  consumer_ = std::thread(&NavigationController::consumeLoop, this);
  return RouteStatus::success();
}

RouteStatus NavigationController::enqueueControl(const NavigationEvent &ev) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  if (!running_ || !channel_.push(ev))
    return RouteStatus::failure(RouteError::NotNavigating,
                                "Navigation is not running");
  return RouteStatus::success();
}

RouteStatus NavigationController::pause() {
  return enqueueControl(NavigationEvent::pause());
}

RouteStatus NavigationController::resume() {
  return enqueueControl(NavigationEvent::resume());
}

void NavigationController::stop() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  stopLocked();
}

void NavigationController::stopLocked() {
  // unsubscribe returns only once no callback into channel_ is in flight
  if (subscription_ >= 0) {
    provider_.unsubscribe(subscription_);
    subscription_ = -1;
  }
  channel_.close();
  if (consumer_.joinable())
    consumer_.join();

  const bool was_running = running_.exchange(false);
  engine_.stopNavigation();
  if (was_running)
    publish();
}

void NavigationController::consumeLoop() {
  NavigationEvent ev;
  while (channel_.pop(ev)) {
    switch (ev.kind) {
    case NavigationEvent::Kind::Fix: {
      const UpdateOutcome outcome = engine_.onLocationUpdate(ev.fix);
      if (outcome == UpdateOutcome::WentOffRoute) {
        std::cout << "[navigation] Off route: "
                  << engine_.snapshot().distance_from_route
                  << " m from route" << std::endl;
      } else if (outcome == UpdateOutcome::BackOnRoute) {
        std::cout << "[navigation] Back on route" << std::endl;
      }
      break;
    }
    case NavigationEvent::Kind::Pause: {
      RouteStatus st = engine_.pauseNavigation();
      if (!st.ok())
        std::cerr << "[navigation] Pause ignored: " << st.message << std::endl;
      break;
    }
    case NavigationEvent::Kind::Resume: {
      RouteStatus st = engine_.resumeNavigation();
      if (!st.ok())
        std::cerr << "[navigation] Resume ignored: " << st.message
                  << std::endl;
      break;
    }
    }
    publish();
  }
}

void NavigationController::publish() {
  auto snap = std::make_shared<NavigationSnapshot>(engine_.snapshot());
  {
    std::lock_guard<std::mutex> lock(snap_mutex_);
    snap->sequence = ++sequence_;
    snapshot_ = std::move(snap);
  }
  snap_cv_.notify_all();
}

std::shared_ptr<const NavigationSnapshot>
NavigationController::snapshot() const {
  std::lock_guard<std::mutex> lock(snap_mutex_);
  return snapshot_;
}

bool NavigationController::waitForSequence(
    uint64_t seq, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(snap_mutex_);
  return snap_cv_.wait_for(lock, timeout,
                           [&] { return sequence_ >= seq; });
}
