#include "KalxScheduler/ManualHostEventLoop.h"

#include <stdexcept>

namespace kalx {

ManualHostEventLoop::ManualHostEventLoop(double startTimeMs)
  : now_(startTimeMs) {
}

double ManualHostEventLoop::now() const {
  return now_;
}

void ManualHostEventLoop::advanceTime(double ms) {
  if (ms < 0.0) {
    throw std::invalid_argument("ManualHostEventLoop cannot move time backwards");
  }
  now_ += ms;
}

bool ManualHostEventLoop::runAnimationFrame() {
  return BasicHostEventLoop::runAnimationFrame(now_);
}

std::size_t ManualHostEventLoop::runUntilIdle(std::size_t maxTurns) {
  std::size_t turns = 0;
  while (true) {
    bool ran = runMicrotasks();
    ran = runExpiredIdleCallbacks() || ran;
    ran = runDueTimers() || ran;
    if (!ran) {
      ran = runAnimationFrame();
    }
    if (!ran) {
      // Nothing else is runnable: the host is idle.
      ran = runIdleCallbacks();
    }
    if (!ran) {
      return turns;
    }
    if (++turns >= maxTurns) {
      throw std::runtime_error("ManualHostEventLoop did not settle within the turn limit");
    }
  }
}

std::size_t ManualHostEventLoop::runAll(std::size_t maxTurns) {
  std::size_t turns = runUntilIdle(maxTurns);
  while (hasPendingWork()) {
    const double wake = nextDeadline();
    if (wake > now_) {
      now_ = wake;
    }
    turns += runUntilIdle(maxTurns);
    if (turns >= maxTurns) {
      throw std::runtime_error("ManualHostEventLoop did not drain within the turn limit");
    }
  }
  return turns;
}

} // namespace kalx
