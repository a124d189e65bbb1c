#pragma once

#include "KalxScheduler/HostEventLoop.h"

#include <cstddef>
#include <deque>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kalx {

/**
 * Queue bookkeeping shared by the concrete host loops.
 *
 * Subclasses supply the clock and decide when each queue gets its turn. A
 * callback that throws propagates out of the run* call that invoked it; it
 * has already been dequeued, so the loop stays usable afterwards.
 */
class BasicHostEventLoop : public HostEventLoop {
public:
  void queueMicrotask(Callback callback) override;
  void requestAnimationFrame(FrameCallback callback) override;
  void requestIdleCallback(Callback callback, double timeoutMs) override;
  HostTimerId setTimeout(Callback callback, double delayMs) override;
  void clearTimeout(HostTimerId id) override;

  // Each returns whether anything ran.
  bool runMicrotasks();
  bool runAnimationFrame(double frameStartMs);
  bool runDueTimers();
  bool runExpiredIdleCallbacks();
  bool runIdleCallbacks();

  [[nodiscard]] std::size_t pendingMicrotasks() const noexcept;
  [[nodiscard]] std::size_t pendingAnimationFrames() const noexcept;
  [[nodiscard]] std::size_t pendingIdleCallbacks() const noexcept;
  [[nodiscard]] std::size_t pendingTimers() const noexcept;
  [[nodiscard]] bool hasPendingWork() const noexcept;

protected:
  BasicHostEventLoop() = default;

  // Earliest timer or idle deadline, +infinity if there is none.
  [[nodiscard]] double nextDeadline() const;

private:
  struct IdleEntry {
    Callback callback;
    double deadline{0.0};
  };

  using TimerKey = std::pair<double, HostTimerId>;

  HostTimerId nextTimerId_{1};
  std::deque<Callback> microtasks_;
  std::vector<FrameCallback> frames_;
  std::deque<IdleEntry> idleCallbacks_;
  std::map<TimerKey, Callback> timers_;
  std::unordered_map<HostTimerId, double> timerDeadlines_;
};

} // namespace kalx
