#pragma once
#include "models/NavigationModel.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Event delivered to the navigation consumer thread.
struct NavigationEvent {
  enum class Kind : uint8_t { Fix = 0, Pause, Resume };
  Kind kind = Kind::Fix;
  LocationFix fix;

  static NavigationEvent location(const LocationFix &f) {
    return NavigationEvent{Kind::Fix, f};
  }
  static NavigationEvent pause() { return NavigationEvent{Kind::Pause, {}}; }
  static NavigationEvent resume() { return NavigationEvent{Kind::Resume, {}}; }
};

// Bounded multi-producer / single-consumer queue. When full, the oldest fix
// is dropped so the consumer always sees the freshest position. Pause and
// resume events are never dropped.
class LocationChannel {
public:
  explicit LocationChannel(std::size_t capacity = 256)
      : capacity_(capacity == 0 ? 1 : capacity) {}

  // Returns false once the channel is closed.
  bool push(const NavigationEvent &ev) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return false;
      if (queue_.size() >= capacity_)
        dropOldestFix();
      queue_.push_back(ev);
    }
    cv_.notify_one();
    return true;
  }

  // Blocks until an event arrives or the channel is closed and drained.
  // Returns false only in the latter case.
  bool pop(NavigationEvent &out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty())
      return false;
    out = queue_.front();
    queue_.pop_front();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  // Re-open an empty channel for a new session.
  void reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    closed_ = false;
    dropped_ = 0;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }
  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }
  std::size_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

private:
  void dropOldestFix() {
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
      if (it->kind == NavigationEvent::Kind::Fix) {
        queue_.erase(it);
        ++dropped_;
        return;
      }
    }
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<NavigationEvent> queue_;
  bool closed_ = false;
  std::size_t dropped_ = 0;
};
