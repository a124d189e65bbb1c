#pragma once

#include "KalxScheduler/Scheduler.h"
#include "KalxScheduler/SchedulerPriorities.h"

#include <cstddef>
#include <functional>
#include <memory>

namespace kalx {

// Priority every transition body runs at.
inline constexpr SchedulerPriority TransitionPriority = SchedulerPriority::LowPriority;

/**
 * Runs `fn` later as a non-urgent LowPriority task.
 *
 * While `fn` runs, isInTransition() is true and onTransitionComplete() queues
 * callbacks that run right after it, also when `fn` throws (the error then
 * propagates out of the work loop as usual).
 *
 * Inside batchTransitions() on the same scheduler, an undelayed transition
 * joins the batch and the returned handle is empty.
 */
TaskHandle startTransition(Scheduler& scheduler, std::function<void()> fn, const TaskOptions& options = {});

// Like startTransition, but always schedules a task of its own, also inside
// batchTransitions(), so the returned handle tracks and cancels the body.
TaskHandle scheduleTransition(Scheduler& scheduler, std::function<void()> fn, const TaskOptions& options = {});

[[nodiscard]] bool isInTransition() noexcept;

// Returns false (and drops the callback) outside a transition body.
bool onTransitionComplete(std::function<void()> callback);

/**
 * Runs `fn` synchronously and collects the transitions it starts into a
 * single LowPriority task. Bodies run in start order, each in its own
 * transition scope; a throwing body does not stop the others and the first
 * error is rethrown once all have run. Returns an empty handle when nothing
 * was started, or when joining an enclosing batch.
 */
TaskHandle batchTransitions(Scheduler& scheduler, const std::function<void()>& fn);

/**
 * Tracks whether transitions started through it are still outstanding. A
 * transition stops being pending once its body has run, or once the
 * scheduler drops it unrun. Copies share the same pending state.
 */
class TransitionTracker {
public:
  explicit TransitionTracker(Scheduler& scheduler);

  [[nodiscard]] bool isPending() const noexcept;
  [[nodiscard]] std::size_t pendingCount() const noexcept;

  TaskHandle start(std::function<void()> fn, const TaskOptions& options = {});

private:
  Scheduler* scheduler_;
  std::shared_ptr<std::size_t> pending_;
};

TransitionTracker useTransition(Scheduler& scheduler);

} // namespace kalx
