#pragma once
#include "core/LocationChannel.hpp"
#include "core/LocationProvider.hpp"
#include "core/NavigationEngine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

// Owns one NavigationEngine and feeds it from a LocationProvider.
//
// The provider callback only enqueues into a LocationChannel; a single
// consumer thread applies fixes and pause/resume to the engine and publishes
// an immutable snapshot after every event. Readers never touch the engine.
class NavigationController {
public:
  explicit NavigationController(LocationProvider &provider,
                                NavigationParams params = NavigationParams{});
  ~NavigationController();

  NavigationController(const NavigationController &) = delete;
  NavigationController &operator=(const NavigationController &) = delete;

  // Starts the engine, subscribes and spawns the consumer. A running session
  // is stopped first. start/stop/pause/resume may be called from any thread;
  // they are serialised on control_mutex_.
  RouteStatus start(const RouteRecord &route);

  // Queued behind any pending fixes. NotNavigating when no session runs.
  RouteStatus pause();
  RouteStatus resume();

  // Unsubscribe, close the channel, join the consumer, reset to Idle. Safe to
  // call at any time.
  void stop();

  bool isRunning() const { return running_.load(); }

  std::shared_ptr<const NavigationSnapshot> snapshot() const;

  // Blocks until a snapshot with sequence >= `seq` is published.
  bool waitForSequence(uint64_t seq, std::chrono::milliseconds timeout) const;

private:
  // Caller holds control_mutex_.
  void stopLocked();
  void consumeLoop();
  void publish();
  RouteStatus enqueueControl(const NavigationEvent &ev);

  LocationProvider &provider_;
  NavigationEngine engine_;
  LocationChannel channel_;
  std::thread consumer_;
  int subscription_ = -1;
  std::atomic<bool> running_{false};
  std::mutex control_mutex_;

  mutable std::mutex snap_mutex_;
  mutable std::condition_variable snap_cv_;
  std::shared_ptr<const NavigationSnapshot> snapshot_;
  uint64_t sequence_ = 0;
};
