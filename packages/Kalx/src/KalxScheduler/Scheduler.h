#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace kalx {

// Lower numeric value means more urgent work.
enum class SchedulerPriority : std::uint8_t {
  NoPriority = 0,
  ImmediatePriority = 1,
  UserBlockingPriority = 2,
  NormalPriority = 3,
  LowPriority = 4,
  IdlePriority = 5,
};

struct TaskHandle {
  std::uint64_t id{0};

  explicit operator bool() const noexcept {
    return id != 0;
  }

  friend bool operator==(const TaskHandle& a, const TaskHandle& b) noexcept {
    return a.id == b.id;
  }

  friend bool operator!=(const TaskHandle& a, const TaskHandle& b) noexcept {
    return a.id != b.id;
  }
};

struct TaskOptions {
  // Relative deadline. Once it passes the task runs even if the slice is
  // exhausted. No timeout means the task never expires.
  std::optional<double> timeoutMs{};
  // Delay before the task becomes eligible to run.
  double delayMs{0.0};
};

/**
 * Outcome of one invocation of a task callback: either the task is done, or
 * it hands back the callback that continues the same job in a later slice.
 */
class TaskResult {
public:
  using Continuation = std::function<TaskResult(bool didTimeout)>;

  static TaskResult done() {
    return TaskResult{};
  }

  static TaskResult continueWith(Continuation next) {
    TaskResult result;
    result.continuation_ = std::move(next);
    return result;
  }

  [[nodiscard]] bool hasContinuation() const noexcept {
    return static_cast<bool>(continuation_);
  }

  [[nodiscard]] Continuation takeContinuation() {
    return std::move(continuation_);
  }

private:
  TaskResult() = default;

  Continuation continuation_{};
};

using Task = std::function<void()>;
using TaskCallback = std::function<TaskResult(bool didTimeout)>;

/**
 * Cooperative run queue shared by everything that submits work for one
 * application root.
 */
class Scheduler {
public:
  virtual ~Scheduler() = default;

  virtual TaskHandle scheduleCallback(
    SchedulerPriority priority,
    TaskCallback callback,
    const TaskOptions& options = {}) = 0;

  // Convenience for work that never needs a continuation.
  TaskHandle scheduleTask(
      SchedulerPriority priority,
      Task task,
      const TaskOptions& options = {}) {
    return scheduleCallback(
      priority,
      [task = std::move(task)](bool) {
        task();
        return TaskResult::done();
      },
      options);
  }

  virtual void cancelTask(TaskHandle handle) = 0;

  [[nodiscard]] virtual SchedulerPriority getCurrentPriorityLevel() const = 0;

  virtual SchedulerPriority runWithPriority(
    SchedulerPriority priority,
    const std::function<void()>& fn) = 0;

  [[nodiscard]] virtual bool shouldYield() const = 0;

  [[nodiscard]] virtual double now() const = 0;
};

} // namespace kalx
