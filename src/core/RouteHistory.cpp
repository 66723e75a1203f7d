// RouteHistory keeps undo/redo snapshots for the route planner.

#include "core/RouteHistory.hpp"
#include <algorithm>

RouteHistory::RouteHistory(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

void RouteHistory::clear() {
  entries_.clear();
  cursor_ = -1;
}

void RouteHistory::seed(const HistoryEntry &entry) {
  entries_.clear();
  entries_.push_back(entry);
  cursor_ = 0;
}

void RouteHistory::push(const HistoryEntry &entry) {
  // discard the redo branch
  entries_.erase(entries_.begin() + (cursor_ + 1), entries_.end());
  entries_.push_back(entry);
  cursor_ = static_cast<int>(entries_.size()) - 1;

  if (entries_.size() > capacity_) {
    // evicted entry (index 0) is always at or before the cursor
    entries_.erase(entries_.begin());
    --cursor_;
  }
}

const HistoryEntry *RouteHistory::undo() {
  if (!canUndo())
    return nullptr;
  --cursor_;
  return &entries_[cursor_];
}

const HistoryEntry *RouteHistory::redo() {
  if (!canRedo())
    return nullptr;
  ++cursor_;
  return &entries_[cursor_];
}
