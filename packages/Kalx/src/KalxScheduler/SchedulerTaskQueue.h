#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace kalx {

/**
 * Ordered run queue for scheduler tasks.
 *
 * Entries are kept sorted by Compare using binary-search insertion. New
 * entries are placed after every entry that compares equal to them, so
 * entries with the same ordering key stay in insertion (FIFO) order.
 * The queue owns its entries; pointers handed out stay valid until the entry
 * is erased or taken.
 */
template <typename T, typename Compare>
class SchedulerTaskQueue {
public:
  SchedulerTaskQueue() = default;

  SchedulerTaskQueue(const SchedulerTaskQueue&) = delete;
  SchedulerTaskQueue& operator=(const SchedulerTaskQueue&) = delete;
  SchedulerTaskQueue(SchedulerTaskQueue&&) = default;
  SchedulerTaskQueue& operator=(SchedulerTaskQueue&&) = default;

  T* insert(std::unique_ptr<T> node) {
    if (node == nullptr) {
      return nullptr;
    }
    auto position = std::upper_bound(
      entries_.begin(),
      entries_.end(),
      node,
      [](const std::unique_ptr<T>& a, const std::unique_ptr<T>& b) {
        return Compare{}(*a, *b);
      });
    T* raw = node.get();
    entries_.insert(position, std::move(node));
    return raw;
  }

  T* peek() const {
    return entries_.empty() ? nullptr : entries_.front().get();
  }

  T* at(std::size_t index) const {
    return index < entries_.size() ? entries_[index].get() : nullptr;
  }

  std::unique_ptr<T> popFront() {
    if (entries_.empty()) {
      return nullptr;
    }
    std::unique_ptr<T> first = std::move(entries_.front());
    entries_.erase(entries_.begin());
    return first;
  }

  // Removes the entry owning `node` and returns it, or nullptr if absent.
  std::unique_ptr<T> take(const T* node) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [node](const std::unique_ptr<T>& entry) {
      return entry.get() == node;
    });
    if (it == entries_.end()) {
      return nullptr;
    }
    std::unique_ptr<T> owned = std::move(*it);
    entries_.erase(it);
    return owned;
  }

  bool erase(const T* node) {
    return take(node) != nullptr;
  }

  T* findById(std::uint64_t id) const {
    for (const auto& entry : entries_) {
      if (entry->id == id) {
        return entry.get();
      }
    }
    return nullptr;
  }

  bool empty() const {
    return entries_.empty();
  }

  std::size_t size() const {
    return entries_.size();
  }

  void clear() {
    entries_.clear();
  }

private:
  std::vector<std::unique_ptr<T>> entries_;
};

} // namespace kalx
