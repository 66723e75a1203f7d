#pragma once
#include "models/RouteModel.hpp"
#include <cstddef>
#include <vector>

// Bounded undo/redo stack of value snapshots.
//
// `cursor()` is a valid index into the entries, or -1 when empty. Entries
// after the cursor are the redo branch and are dropped by the next push().
// Once full, push() evicts the oldest entry.
class RouteHistory {
public:
  static constexpr std::size_t kDefaultCapacity = 50;

  explicit RouteHistory(std::size_t capacity = kDefaultCapacity);

  void clear();

  // Replace everything with a single entry (cursor 0).
  void seed(const HistoryEntry &entry);

  void push(const HistoryEntry &entry);

  // Step the cursor and return the entry now under it, or nullptr at the
  // boundary. The pointer is valid until the next mutation.
  const HistoryEntry *undo();
  const HistoryEntry *redo();

  bool canUndo() const { return cursor_ > 0; }
  bool canRedo() const {
    return cursor_ + 1 < static_cast<int>(entries_.size());
  }

  int cursor() const { return cursor_; }
  std::size_t size() const { return entries_.size(); }
  std::size_t capacity() const { return capacity_; }
  const std::vector<HistoryEntry> &entries() const { return entries_; }

private:
  std::size_t capacity_;
  std::vector<HistoryEntry> entries_;
  int cursor_ = -1;
};
