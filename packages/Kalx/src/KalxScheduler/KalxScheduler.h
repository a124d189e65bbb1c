#pragma once

#include "KalxScheduler/HostEventLoop.h"
#include "KalxScheduler/Scheduler.h"
#include "KalxScheduler/SchedulerFeatureFlags.h"
#include "KalxScheduler/SchedulerPriorities.h"
#include "KalxScheduler/SchedulerTaskQueue.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace kalx {

/**
 * Internal task representation for the scheduler.
 */
struct SchedulerTask {
  std::uint64_t id;
  TaskCallback callback;
  SchedulerPriority priorityLevel;
  double startTime;
  double expirationTime;
  bool cancelled{false};

  SchedulerTask(std::uint64_t taskId, TaskCallback cb, SchedulerPriority priority, double start, double expiration)
    : id(taskId), callback(std::move(cb)), priorityLevel(priority), startTime(start), expirationTime(expiration) {}
};

// Run queue order: priority, then expiration. Ties keep insertion order.
struct TaskQueueOrder {
  bool operator()(const SchedulerTask& a, const SchedulerTask& b) const {
    if (a.priorityLevel != b.priorityLevel) {
      return isHigherPriority(a.priorityLevel, b.priorityLevel);
    }
    return a.expirationTime < b.expirationTime;
  }
};

// Delayed tasks wait here ordered by the time they become eligible.
struct TimerQueueOrder {
  bool operator()(const SchedulerTask& a, const SchedulerTask& b) const {
    return a.startTime < b.startTime;
  }
};

/**
 * Default Kalx Scheduler implementation.
 *
 * - Sorted run queue with binary insertion (priority, expiration, FIFO)
 * - Separate timer queue for delayed tasks
 * - Time slicing with a per-slice budget (frameYieldMs by default)
 * - Expired tasks run ahead of the queue head and ignore the slice budget
 * - Host dispatch chosen from the head priority: microtask for Immediate and
 *   UserBlocking, animation frame for Normal and Low, idle callback for Idle
 *
 * The scheduler never blocks. All work runs from callbacks it registers on
 * the HostEventLoop passed at construction, which must outlive it.
 */
class KalxScheduler : public Scheduler {
private:
  using TaskQueue = SchedulerTaskQueue<SchedulerTask, TaskQueueOrder>;
  using TimerQueue = SchedulerTaskQueue<SchedulerTask, TimerQueueOrder>;

  HostEventLoop& host_;
  SchedulerConfig config_;

  // Task queues
  TaskQueue taskQueue_;
  TimerQueue timerQueue_;

  // Current state
  std::uint64_t nextTaskId_{1};
  SchedulerPriority currentPriorityLevel_{SchedulerPriority::NormalPriority};
  SchedulerTask* currentTask_{nullptr};

  // Scheduling state
  bool isPerformingWork_{false};
  bool isMessageLoopRunning_{false};
  bool needsPaint_{false};
  std::optional<HostDispatchStrategy> pendingStrategy_{};
  std::uint64_t dispatchGeneration_{0};
  std::optional<HostTimerId> hostTimeoutId_{};

  // Time management
  double frameInterval_;
  double startTime_{-1.0};
  double deadline_{-1.0};

  // Host callbacks hold a weak reference so they turn into no-ops once the
  // scheduler is gone.
  std::shared_ptr<KalxScheduler*> self_;

public:
  explicit KalxScheduler(HostEventLoop& host, SchedulerConfig config = {});
  ~KalxScheduler() override;

  KalxScheduler(const KalxScheduler&) = delete;
  KalxScheduler& operator=(const KalxScheduler&) = delete;

  // Scheduler interface implementation
  TaskHandle scheduleCallback(
    SchedulerPriority priority,
    TaskCallback callback,
    const TaskOptions& options = {}) override;

  void cancelTask(TaskHandle handle) override;

  [[nodiscard]] SchedulerPriority getCurrentPriorityLevel() const override;

  SchedulerPriority runWithPriority(
    SchedulerPriority priority,
    const std::function<void()>& fn) override;

  [[nodiscard]] bool shouldYield() const override;

  [[nodiscard]] double now() const override;

  // Additional Scheduler functionality
  void forceFrameRate(double fps);
  void requestPaint();
  bool flushWork(double initialTime);
  void advanceTimers(double currentTime);

  // Runs one slice starting now. Returns whether work remains.
  bool performWorkUntilDeadline();

  [[nodiscard]] bool isPerformingWork() const noexcept;
  [[nodiscard]] bool isMessageLoopRunning() const noexcept;
  [[nodiscard]] std::size_t pendingTaskCount() const;
  [[nodiscard]] double frameInterval() const noexcept;

  // Drops every queued and delayed task and any pending host dispatch.
  void reset();

private:
  bool runSlice(double sliceStartMs);
  bool workLoop(double initialTime);
  SchedulerTask* selectNextTask(double currentTime);
  [[noreturn]] void failCurrentTask(SchedulerTask* task, const char* what);

  void requestHostWork();
  void dispatch(HostDispatchStrategy strategy);
  void onHostDispatch(std::uint64_t generation, double sliceStartMs);
  void scheduleFollowUp();

  void scheduleHostTimeout(double delay);
  void cancelHostTimeout();
  void handleTimeout();
};

} // namespace kalx
