#include "KalxScheduler/BasicHostEventLoop.h"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <utility>

namespace kalx {

void BasicHostEventLoop::queueMicrotask(Callback callback) {
  if (callback) {
    microtasks_.push_back(std::move(callback));
  }
}

void BasicHostEventLoop::requestAnimationFrame(FrameCallback callback) {
  if (callback) {
    frames_.push_back(std::move(callback));
  }
}

void BasicHostEventLoop::requestIdleCallback(Callback callback, double timeoutMs) {
  if (callback) {
    idleCallbacks_.push_back(IdleEntry{std::move(callback), now() + std::max(0.0, timeoutMs)});
  }
}

HostTimerId BasicHostEventLoop::setTimeout(Callback callback, double delayMs) {
  const HostTimerId id = nextTimerId_++;
  if (!callback) {
    return id;
  }
  const double deadline = now() + std::max(0.0, delayMs);
  timers_.emplace(TimerKey{deadline, id}, std::move(callback));
  timerDeadlines_.emplace(id, deadline);
  return id;
}

void BasicHostEventLoop::clearTimeout(HostTimerId id) {
  auto it = timerDeadlines_.find(id);
  if (it == timerDeadlines_.end()) {
    return;
  }
  timers_.erase(TimerKey{it->second, id});
  timerDeadlines_.erase(it);
}

bool BasicHostEventLoop::runMicrotasks() {
  bool ran = false;
  while (!microtasks_.empty()) {
    Callback callback = std::move(microtasks_.front());
    microtasks_.pop_front();
    ran = true;
    callback();
  }
  return ran;
}

bool BasicHostEventLoop::runAnimationFrame(double frameStartMs) {
  if (frames_.empty()) {
    return false;
  }
  // Callbacks requested while this frame runs belong to the next frame.
  std::vector<FrameCallback> frame;
  frame.swap(frames_);
  for (std::size_t index = 0; index < frame.size(); ++index) {
    FrameCallback callback = std::move(frame[index]);
    try {
      callback(frameStartMs);
    } catch (...) {
      // Callbacks that did not get their turn stay queued ahead of new ones.
      frames_.insert(
        frames_.begin(),
        std::make_move_iterator(frame.begin() + static_cast<std::ptrdiff_t>(index) + 1),
        std::make_move_iterator(frame.end()));
      throw;
    }
    runMicrotasks();
  }
  return true;
}

bool BasicHostEventLoop::runDueTimers() {
  bool ran = false;
  while (!timers_.empty() && timers_.begin()->first.first <= now()) {
    auto first = timers_.begin();
    const HostTimerId id = first->first.second;
    Callback callback = std::move(first->second);
    timers_.erase(first);
    timerDeadlines_.erase(id);
    ran = true;
    callback();
    runMicrotasks();
  }
  return ran;
}

bool BasicHostEventLoop::runExpiredIdleCallbacks() {
  bool ran = false;
  std::size_t index = 0;
  while (index < idleCallbacks_.size()) {
    if (idleCallbacks_[index].deadline > now()) {
      ++index;
      continue;
    }
    Callback callback = std::move(idleCallbacks_[index].callback);
    idleCallbacks_.erase(idleCallbacks_.begin() + static_cast<std::ptrdiff_t>(index));
    ran = true;
    callback();
    runMicrotasks();
  }
  return ran;
}

bool BasicHostEventLoop::runIdleCallbacks() {
  if (idleCallbacks_.empty()) {
    return false;
  }
  std::deque<IdleEntry> idle;
  idle.swap(idleCallbacks_);
  while (!idle.empty()) {
    Callback callback = std::move(idle.front().callback);
    idle.pop_front();
    try {
      callback();
    } catch (...) {
      for (auto it = idle.rbegin(); it != idle.rend(); ++it) {
        idleCallbacks_.push_front(std::move(*it));
      }
      throw;
    }
    runMicrotasks();
  }
  return true;
}

std::size_t BasicHostEventLoop::pendingMicrotasks() const noexcept {
  return microtasks_.size();
}

std::size_t BasicHostEventLoop::pendingAnimationFrames() const noexcept {
  return frames_.size();
}

std::size_t BasicHostEventLoop::pendingIdleCallbacks() const noexcept {
  return idleCallbacks_.size();
}

std::size_t BasicHostEventLoop::pendingTimers() const noexcept {
  return timers_.size();
}

bool BasicHostEventLoop::hasPendingWork() const noexcept {
  return !microtasks_.empty() || !frames_.empty() || !idleCallbacks_.empty() || !timers_.empty();
}

double BasicHostEventLoop::nextDeadline() const {
  double wake = std::numeric_limits<double>::infinity();
  if (!timers_.empty()) {
    wake = std::min(wake, timers_.begin()->first.first);
  }
  for (const auto& entry : idleCallbacks_) {
    wake = std::min(wake, entry.deadline);
  }
  return wake;
}

} // namespace kalx
