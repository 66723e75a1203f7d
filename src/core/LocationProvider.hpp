#pragma once
#include "models/NavigationModel.hpp"
#include <functional>
#include <map>
#include <mutex>

using LocationCallback = std::function<void(const LocationFix &fix)>;

// Source of GPS fixes. Callbacks may run on any thread.
class LocationProvider {
public:
  virtual ~LocationProvider() = default;

  // Returns subscriber ID, or -1 on failure
  virtual int subscribe(LocationCallback callback) = 0;

  // Unsubscribe by ID; unknown ids are ignored. Once this returns the
  // callback is neither running nor invoked again.
  virtual void unsubscribe(int subscriber_id) = 0;
};

// In-process provider: whoever owns a fix calls publish() and every current
// subscriber is invoked synchronously on the caller's thread.
//
// Deliveries are serialised by dispatch_mutex_. unsubscribe() takes it after
// removing the entry, so once it returns the callback is not running and will
// not run again. Callbacks must not call back into the provider.
class PushLocationProvider : public LocationProvider {
public:
  int subscribe(LocationCallback callback) override {
    if (!callback)
      return -1;
    std::lock_guard<std::mutex> lock(mutex_);
    const int id = next_id_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
  }

  void unsubscribe(int subscriber_id) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      subscribers_.erase(subscriber_id);
    }
    // wait out a publish() that may still hold a copy of the callback
    std::lock_guard<std::mutex> drain(dispatch_mutex_);
  }

  // Returns the number of subscribers notified.
  std::size_t publish(const LocationFix &fix) {
    std::lock_guard<std::mutex> dispatch(dispatch_mutex_);
    std::map<int, LocationCallback> targets;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      targets = subscribers_;
    }
    for (auto &[id, cb] : targets)
      cb(fix);
    return targets.size();
  }

  std::size_t subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
  }

private:
  mutable std::mutex mutex_;
  std::mutex dispatch_mutex_;
  std::map<int, LocationCallback> subscribers_;
  int next_id_ = 0;
};
