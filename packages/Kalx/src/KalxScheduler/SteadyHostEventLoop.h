#pragma once

#include "KalxScheduler/BasicHostEventLoop.h"

#include <chrono>

namespace kalx {

/**
 * Host loop on std::chrono::steady_clock.
 *
 * Frame callbacks are paced to frameIntervalMs; idle callbacks run in the
 * gaps between frames. run() sleeps until the next due callback and returns
 * once every queue is empty or stop() was called from a callback.
 */
class SteadyHostEventLoop final : public BasicHostEventLoop {
public:
  explicit SteadyHostEventLoop(double frameIntervalMs = 1000.0 / 60.0);

  [[nodiscard]] double now() const override;

  void run();
  void stop() noexcept;

  // A single pass over everything runnable right now.
  bool runOnce();

private:
  void sleepUntil(double wakeMs) const;

  std::chrono::steady_clock::time_point baseTime_;
  double frameIntervalMs_;
  double nextFrameTime_{0.0};
  bool stopped_{false};
};

} // namespace kalx
