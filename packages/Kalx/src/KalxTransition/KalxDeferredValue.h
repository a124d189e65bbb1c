#pragma once

#include "KalxScheduler/Scheduler.h"
#include "KalxTransition/KalxTransition.h"

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <utility>

namespace kalx {

inline constexpr double defaultDeferredTimeoutMs = 100.0;
inline constexpr double defaultThrottleIntervalMs = 100.0;

using ValueSubscription = std::uint64_t;

/**
 * Listener registry shared by the lagging value types.
 * Listeners added or removed during a notification take effect next time.
 */
template <typename T>
class ValueListeners {
public:
  using Listener = std::function<void(const T&)>;

  ValueSubscription add(Listener listener) {
    if (!listener) {
      throw std::invalid_argument("value listener must be callable");
    }
    const ValueSubscription id = nextId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
  }

  bool remove(ValueSubscription id) {
    return listeners_.erase(id) > 0;
  }

  void notify(const T& value) const {
    const std::map<ValueSubscription, Listener> snapshot = listeners_;
    for (const auto& entry : snapshot) {
      entry.second(value);
    }
  }

private:
  ValueSubscription nextId_{1};
  std::map<ValueSubscription, Listener> listeners_;
};

struct DeferredValueOptions {
  double timeoutMs{defaultDeferredTimeoutMs};
};

/**
 * A mirror of an input that follows it only after the input has been quiet
 * for timeoutMs, and then only through a transition. set() never changes
 * get() synchronously. Each set() restarts the quiet period; the eventual
 * commit writes the most recent input.
 *
 * The scheduler must outlive the value. Create through useDeferredValue.
 */
template <typename T>
class DeferredValue : public std::enable_shared_from_this<DeferredValue<T>> {
public:
  using Listener = typename ValueListeners<T>::Listener;

  DeferredValue(Scheduler& scheduler, T initial, DeferredValueOptions options)
    : scheduler_(scheduler),
      options_(options),
      current_(initial),
      latest_(std::move(initial)) {
    if (!(options_.timeoutMs >= 0.0)) {
      throw std::invalid_argument("DeferredValueOptions::timeoutMs must not be negative");
    }
  }

  ~DeferredValue() {
    scheduler_.cancelTask(pending_);
  }

  DeferredValue(const DeferredValue&) = delete;
  DeferredValue& operator=(const DeferredValue&) = delete;

  [[nodiscard]] const T& get() const noexcept {
    return current_;
  }

  [[nodiscard]] const T& latest() const noexcept {
    return latest_;
  }

  [[nodiscard]] bool isPending() const noexcept {
    return static_cast<bool>(pending_);
  }

  void set(T value) {
    latest_ = std::move(value);
    scheduler_.cancelTask(pending_);
    pending_ = TaskHandle{};

    if (latest_ == current_) {
      return;
    }

    std::weak_ptr<DeferredValue> weak = this->weak_from_this();
    TaskOptions options;
    options.delayMs = options_.timeoutMs;
    pending_ = scheduleTransition(
      scheduler_,
      [weak]() {
        if (auto self = weak.lock()) {
          self->commit();
        }
      },
      options);
  }

  ValueSubscription subscribe(Listener listener) {
    return listeners_.add(std::move(listener));
  }

  bool unsubscribe(ValueSubscription id) {
    return listeners_.remove(id);
  }

private:
  void commit() {
    pending_ = TaskHandle{};
    if (current_ == latest_) {
      return;
    }
    current_ = latest_;
    listeners_.notify(current_);
  }

  Scheduler& scheduler_;
  DeferredValueOptions options_;
  T current_;
  T latest_;
  TaskHandle pending_{};
  ValueListeners<T> listeners_;
};

template <typename T>
std::shared_ptr<DeferredValue<T>> useDeferredValue(
    Scheduler& scheduler,
    T initial,
    DeferredValueOptions options = {}) {
  return std::make_shared<DeferredValue<T>>(scheduler, std::move(initial), options);
}

/**
 * A value that changes visibly at most once per interval.
 *
 * The first set() after a quiet interval is written immediately. Later sets
 * inside the interval coalesce: only the most recent one is written, by a
 * transition that becomes due when the interval ends.
 *
 * The scheduler must outlive the value. Create through useThrottledValue.
 */
template <typename T>
class ThrottledValue : public std::enable_shared_from_this<ThrottledValue<T>> {
public:
  using Listener = typename ValueListeners<T>::Listener;

  ThrottledValue(Scheduler& scheduler, T initial, double intervalMs)
    : scheduler_(scheduler),
      intervalMs_(intervalMs),
      current_(initial),
      latest_(std::move(initial)) {
    if (!(intervalMs_ >= 0.0)) {
      throw std::invalid_argument("throttle interval must not be negative");
    }
  }

  ~ThrottledValue() {
    scheduler_.cancelTask(pending_);
  }

  ThrottledValue(const ThrottledValue&) = delete;
  ThrottledValue& operator=(const ThrottledValue&) = delete;

  [[nodiscard]] const T& get() const noexcept {
    return current_;
  }

  [[nodiscard]] bool isPending() const noexcept {
    return static_cast<bool>(pending_);
  }

  [[nodiscard]] double intervalMs() const noexcept {
    return intervalMs_;
  }

  void set(T value) {
    latest_ = std::move(value);
    scheduler_.cancelTask(pending_);
    pending_ = TaskHandle{};

    const double currentTime = scheduler_.now();
    const double elapsed = currentTime - lastUpdate_;
    if (elapsed >= intervalMs_) {
      lastUpdate_ = currentTime;
      write();
      return;
    }

    std::weak_ptr<ThrottledValue> weak = this->weak_from_this();
    TaskOptions options;
    options.delayMs = intervalMs_ - elapsed;
    pending_ = scheduleTransition(
      scheduler_,
      [weak]() {
        if (auto self = weak.lock()) {
          self->pending_ = TaskHandle{};
          self->lastUpdate_ = self->scheduler_.now();
          self->write();
        }
      },
      options);
  }

  ValueSubscription subscribe(Listener listener) {
    return listeners_.add(std::move(listener));
  }

  bool unsubscribe(ValueSubscription id) {
    return listeners_.remove(id);
  }

private:
  void write() {
    if (current_ == latest_) {
      return;
    }
    current_ = latest_;
    listeners_.notify(current_);
  }

  Scheduler& scheduler_;
  double intervalMs_;
  T current_;
  T latest_;
  double lastUpdate_{-std::numeric_limits<double>::infinity()};
  TaskHandle pending_{};
  ValueListeners<T> listeners_;
};

template <typename T>
std::shared_ptr<ThrottledValue<T>> useThrottledValue(
    Scheduler& scheduler,
    T initial,
    double intervalMs = defaultThrottleIntervalMs) {
  return std::make_shared<ThrottledValue<T>>(scheduler, std::move(initial), intervalMs);
}

} // namespace kalx
