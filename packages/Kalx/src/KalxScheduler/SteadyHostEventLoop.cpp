#include "KalxScheduler/SteadyHostEventLoop.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace kalx {

SteadyHostEventLoop::SteadyHostEventLoop(double frameIntervalMs)
  : baseTime_(std::chrono::steady_clock::now()),
    frameIntervalMs_(frameIntervalMs) {
  if (!(frameIntervalMs > 0.0) || !std::isfinite(frameIntervalMs)) {
    throw std::invalid_argument("SteadyHostEventLoop frame interval must be positive");
  }
}

double SteadyHostEventLoop::now() const {
  const auto elapsed = std::chrono::steady_clock::now() - baseTime_;
  return std::chrono::duration<double, std::milli>(elapsed).count();
}

void SteadyHostEventLoop::run() {
  stopped_ = false;
  while (!stopped_ && hasPendingWork()) {
    if (runOnce()) {
      continue;
    }
    double wake = nextDeadline();
    if (pendingAnimationFrames() > 0) {
      wake = std::min(wake, nextFrameTime_);
    }
    sleepUntil(wake);
  }
}

void SteadyHostEventLoop::stop() noexcept {
  stopped_ = true;
}

bool SteadyHostEventLoop::runOnce() {
  bool ran = runMicrotasks();
  ran = runExpiredIdleCallbacks() || ran;
  ran = runDueTimers() || ran;

  const double frameStart = now();
  if (pendingAnimationFrames() > 0 && frameStart >= nextFrameTime_) {
    nextFrameTime_ = frameStart + frameIntervalMs_;
    ran = BasicHostEventLoop::runAnimationFrame(frameStart) || ran;
  }

  if (!ran) {
    ran = runIdleCallbacks();
  }
  return ran;
}

void SteadyHostEventLoop::sleepUntil(double wakeMs) const {
  if (!std::isfinite(wakeMs)) {
    return;
  }
  const double remaining = wakeMs - now();
  if (remaining > 0.0) {
    std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(remaining));
  }
}

} // namespace kalx
