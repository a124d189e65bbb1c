#include "KalxScheduler/KalxScheduler.h"

#include "shared/KalxErrors.h"

#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <utility>

namespace kalx {

KalxScheduler::KalxScheduler(HostEventLoop& host, SchedulerConfig config)
  : host_(host),
    config_(config),
    frameInterval_(config.frameYieldMs),
    self_(std::make_shared<KalxScheduler*>(this)) {
  if (!(config_.frameYieldMs > 0.0)) {
    throw std::invalid_argument("SchedulerConfig::frameYieldMs must be positive");
  }
  if (!(config_.idleCallbackTimeoutMs >= 0.0)) {
    throw std::invalid_argument("SchedulerConfig::idleCallbackTimeoutMs must not be negative");
  }
}

KalxScheduler::~KalxScheduler() {
  cancelHostTimeout();
  self_.reset();
}

TaskHandle KalxScheduler::scheduleCallback(
    SchedulerPriority priority,
    TaskCallback callback,
    const TaskOptions& options) {
  if (!callback) {
    throw std::invalid_argument("KalxScheduler::scheduleCallback requires a callback");
  }
  if (!(options.delayMs >= 0.0)) {
    throw std::invalid_argument("TaskOptions::delayMs must not be negative");
  }
  if (options.timeoutMs && !(*options.timeoutMs >= 0.0)) {
    throw std::invalid_argument("TaskOptions::timeoutMs must not be negative");
  }
  if (!isValidPriority(priority)) {
    priority = SchedulerPriority::NormalPriority;
  }

  const double currentTime = now();
  const double startTime = currentTime + options.delayMs;
  const double expirationTime = options.timeoutMs
    ? startTime + *options.timeoutMs
    : std::numeric_limits<double>::infinity();

  auto task = std::make_unique<SchedulerTask>(
    nextTaskId_++, std::move(callback), priority, startTime, expirationTime);
  const TaskHandle handle{task->id};

  if (startTime > currentTime) {
    SchedulerTask* timer = timerQueue_.insert(std::move(task));
    if (timer == timerQueue_.peek()) {
      scheduleHostTimeout(startTime - currentTime);
    }
  } else {
    taskQueue_.insert(std::move(task));
    requestHostWork();
  }

  return handle;
}

void KalxScheduler::cancelTask(TaskHandle handle) {
  if (!handle) {
    return;
  }

  SchedulerTask* task = taskQueue_.findById(handle.id);
  if (task == nullptr) {
    task = timerQueue_.findById(handle.id);
  }
  if (task == nullptr || task->cancelled) {
    return;
  }

  // Left in place; the next scan drops it. A running task keeps running.
  task->cancelled = true;
  task->callback = nullptr;
}

SchedulerPriority KalxScheduler::getCurrentPriorityLevel() const {
  return currentPriorityLevel_;
}

SchedulerPriority KalxScheduler::runWithPriority(
    SchedulerPriority priority,
    const std::function<void()>& fn) {
  if (!isValidPriority(priority)) {
    priority = SchedulerPriority::NormalPriority;
  }

  const SchedulerPriority previousPriority = currentPriorityLevel_;
  currentPriorityLevel_ = priority;

  try {
    fn();
  } catch (...) {
    currentPriorityLevel_ = previousPriority;
    throw;
  }

  currentPriorityLevel_ = previousPriority;
  return previousPriority;
}

bool KalxScheduler::shouldYield() const {
  if (startTime_ < 0.0) {
    return false;
  }
  if (enableRequestPaint && needsPaint_) {
    return true;
  }
  return now() >= deadline_;
}

double KalxScheduler::now() const {
  return host_.now();
}

void KalxScheduler::forceFrameRate(double fps) {
  if (!(fps >= 0.0 && fps <= maxFrameRate)) {
    throw std::invalid_argument("forceFrameRate expects a rate between 0 and 125 fps");
  }

  if (fps > 0.0) {
    frameInterval_ = 1000.0 / fps;
  } else {
    frameInterval_ = config_.frameYieldMs;
  }
}

void KalxScheduler::requestPaint() {
  needsPaint_ = true;
}

bool KalxScheduler::flushWork(double initialTime) {
  if (isPerformingWork_) {
    return true;
  }

  cancelHostTimeout();

  isPerformingWork_ = true;
  const SchedulerPriority previousPriority = currentPriorityLevel_;

  bool hasMoreWork = false;

  try {
    hasMoreWork = workLoop(initialTime);
  } catch (...) {
    currentTask_ = nullptr;
    currentPriorityLevel_ = previousPriority;
    isPerformingWork_ = false;
    throw;
  }

  currentTask_ = nullptr;
  currentPriorityLevel_ = previousPriority;
  isPerformingWork_ = false;

  return hasMoreWork;
}

void KalxScheduler::advanceTimers(double currentTime) {
  bool promoted = false;
  SchedulerTask* timer = timerQueue_.peek();
  while (timer != nullptr) {
    if (timer->cancelled) {
      timerQueue_.popFront();
    } else if (timer->startTime <= currentTime) {
      taskQueue_.insert(timerQueue_.popFront());
      promoted = true;
    } else {
      break;
    }
    timer = timerQueue_.peek();
  }

  if (promoted) {
    requestHostWork();
  }
}

bool KalxScheduler::performWorkUntilDeadline() {
  return runSlice(now());
}

bool KalxScheduler::isPerformingWork() const noexcept {
  return isPerformingWork_;
}

bool KalxScheduler::isMessageLoopRunning() const noexcept {
  return isMessageLoopRunning_;
}

std::size_t KalxScheduler::pendingTaskCount() const {
  std::size_t count = 0;
  for (std::size_t index = 0; index < taskQueue_.size(); ++index) {
    if (!taskQueue_.at(index)->cancelled) {
      ++count;
    }
  }
  for (std::size_t index = 0; index < timerQueue_.size(); ++index) {
    if (!timerQueue_.at(index)->cancelled) {
      ++count;
    }
  }
  return count;
}

double KalxScheduler::frameInterval() const noexcept {
  return frameInterval_;
}

void KalxScheduler::reset() {
  if (isPerformingWork_) {
    throw std::logic_error("KalxScheduler::reset cannot run while the scheduler is performing work");
  }

  taskQueue_.clear();
  timerQueue_.clear();
  cancelHostTimeout();

  // Any dispatch already handed to the host becomes stale.
  ++dispatchGeneration_;
  pendingStrategy_.reset();
  isMessageLoopRunning_ = false;
  needsPaint_ = false;
  startTime_ = -1.0;
  deadline_ = -1.0;
  currentTask_ = nullptr;
  currentPriorityLevel_ = SchedulerPriority::NormalPriority;
}

bool KalxScheduler::runSlice(double sliceStartMs) {
  if (isPerformingWork_) {
    return true;
  }

  needsPaint_ = false;
  startTime_ = sliceStartMs;
  deadline_ = sliceStartMs + frameInterval_;

  bool hasMoreWork = false;
  try {
    hasMoreWork = flushWork(now());
  } catch (...) {
    startTime_ = -1.0;
    isMessageLoopRunning_ = false;
    // The failed task is gone; whatever is left drains on the next request.
    scheduleFollowUp();
    throw;
  }

  startTime_ = -1.0;
  isMessageLoopRunning_ = false;

  if (hasMoreWork) {
    scheduleFollowUp();
  }
  return hasMoreWork;
}

bool KalxScheduler::workLoop(double initialTime) {
  double currentTime = initialTime;
  advanceTimers(currentTime);
  currentTask_ = selectNextTask(currentTime);

  while (currentTask_ != nullptr) {
    const bool didTimeout = currentTask_->expirationTime <= currentTime;
    if (!didTimeout && shouldYield()) {
      break;
    }

    SchedulerTask* task = currentTask_;
    TaskCallback callback = std::move(task->callback);
    task->callback = nullptr;
    currentPriorityLevel_ = task->priorityLevel;

    TaskResult result = TaskResult::done();
    try {
      result = callback(didTimeout);
    } catch (const std::exception& ex) {
      failCurrentTask(task, ex.what());
    } catch (...) {
      failCurrentTask(task, "unknown error");
    }

    currentTime = now();

    if (result.hasContinuation() && !task->cancelled) {
      // Same task, same priority and expiration; only the callback changes.
      task->callback = result.takeContinuation();
    } else {
      taskQueue_.erase(task);
    }

    advanceTimers(currentTime);
    currentTask_ = selectNextTask(currentTime);
  }

  if (currentTask_ != nullptr) {
    return true;
  }

  SchedulerTask* firstTimer = timerQueue_.peek();
  if (firstTimer != nullptr) {
    scheduleHostTimeout(firstTimer->startTime - currentTime);
  }
  return false;
}

SchedulerTask* KalxScheduler::selectNextTask(double currentTime) {
  SchedulerTask* head = nullptr;
  std::size_t index = 0;
  while (SchedulerTask* task = taskQueue_.at(index)) {
    if (task->cancelled) {
      taskQueue_.erase(task);
      continue;
    }
    if (task->expirationTime <= currentTime) {
      return task;
    }
    if (head == nullptr) {
      head = task;
    }
    ++index;
  }
  return head;
}

void KalxScheduler::failCurrentTask(SchedulerTask* task, const char* what) {
  const std::uint64_t taskId = task->id;
  const SchedulerPriority priority = task->priorityLevel;
  taskQueue_.erase(task);
  currentTask_ = nullptr;
  std::throw_with_nested(SchedulingError(taskId, priority, what));
}

void KalxScheduler::requestHostWork() {
  if (isPerformingWork_) {
    // The running flush re-requests on exit.
    return;
  }

  SchedulerTask* head = taskQueue_.peek();
  if (head == nullptr) {
    return;
  }

  const HostDispatchStrategy strategy = dispatchStrategyFor(head->priorityLevel);
  if (pendingStrategy_ && *pendingStrategy_ <= strategy) {
    return;
  }
  dispatch(strategy);
}

void KalxScheduler::dispatch(HostDispatchStrategy strategy) {
  pendingStrategy_ = strategy;
  isMessageLoopRunning_ = true;
  const std::uint64_t generation = ++dispatchGeneration_;
  std::weak_ptr<KalxScheduler*> weak = self_;

  switch (strategy) {
    case HostDispatchStrategy::Microtask:
      host_.queueMicrotask([weak, generation]() {
        if (auto self = weak.lock()) {
          (*self)->onHostDispatch(generation, (*self)->now());
        }
      });
      break;
    case HostDispatchStrategy::AnimationFrame:
      host_.requestAnimationFrame([weak, generation](double frameStartMs) {
        if (auto self = weak.lock()) {
          (*self)->onHostDispatch(generation, frameStartMs);
        }
      });
      break;
    case HostDispatchStrategy::IdleCallback:
      host_.requestIdleCallback(
        [weak, generation]() {
          if (auto self = weak.lock()) {
            (*self)->onHostDispatch(generation, (*self)->now());
          }
        },
        config_.idleCallbackTimeoutMs);
      break;
  }
}

void KalxScheduler::onHostDispatch(std::uint64_t generation, double sliceStartMs) {
  if (generation != dispatchGeneration_) {
    // Superseded by a faster dispatch or by reset().
    return;
  }
  pendingStrategy_.reset();
  runSlice(sliceStartMs);
}

void KalxScheduler::scheduleFollowUp() {
  if (!taskQueue_.empty()) {
    requestHostWork();
    return;
  }
  SchedulerTask* firstTimer = timerQueue_.peek();
  if (firstTimer != nullptr) {
    scheduleHostTimeout(firstTimer->startTime - now());
  }
}

void KalxScheduler::scheduleHostTimeout(double delay) {
  cancelHostTimeout();
  std::weak_ptr<KalxScheduler*> weak = self_;
  hostTimeoutId_ = host_.setTimeout(
    [weak]() {
      if (auto self = weak.lock()) {
        (*self)->handleTimeout();
      }
    },
    delay > 0.0 ? delay : 0.0);
}

void KalxScheduler::cancelHostTimeout() {
  if (hostTimeoutId_) {
    host_.clearTimeout(*hostTimeoutId_);
    hostTimeoutId_.reset();
  }
}

void KalxScheduler::handleTimeout() {
  hostTimeoutId_.reset();
  advanceTimers(now());
  scheduleFollowUp();
}

} // namespace kalx
