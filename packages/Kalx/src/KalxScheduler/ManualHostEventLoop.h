#pragma once

#include "KalxScheduler/BasicHostEventLoop.h"

#include <cstddef>

namespace kalx {

/**
 * Deterministic host loop driven by hand.
 *
 * The clock only moves when advanceTime() is called, so slices, deadlines
 * and timers can be exercised without sleeping.
 */
class ManualHostEventLoop final : public BasicHostEventLoop {
public:
  explicit ManualHostEventLoop(double startTimeMs = 0.0);

  [[nodiscard]] double now() const override;

  void advanceTime(double ms);

  // Runs the queued frame callbacks with the current time as frame start.
  bool runAnimationFrame();

  // Runs turns (microtasks, expired idle callbacks, due timers, one frame,
  // then idle callbacks once nothing else is runnable) until no callback is
  // runnable at the current time. Returns the number of turns taken.
  std::size_t runUntilIdle(std::size_t maxTurns = 10000);

  // Like runUntilIdle, but jumps the clock to each pending timer or idle
  // deadline until every queue is empty.
  std::size_t runAll(std::size_t maxTurns = 10000);

private:
  double now_;
};

} // namespace kalx
