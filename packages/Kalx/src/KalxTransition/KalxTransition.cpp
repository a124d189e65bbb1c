#include "KalxTransition/KalxTransition.h"

#include <cstddef>
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace kalx {

namespace {

struct TransitionScope {
  std::vector<std::function<void()>> completions;
};

struct TransitionBatch {
  Scheduler* scheduler;
  std::vector<std::function<void()>> bodies;
};

thread_local TransitionScope* currentTransition = nullptr;
thread_local TransitionBatch* currentBatch = nullptr;

void runCompletions(TransitionScope& scope) {
  std::vector<std::function<void()>> completions = std::move(scope.completions);
  for (const auto& completion : completions) {
    completion();
  }
}

void runTransitionBody(const std::function<void()>& body) {
  TransitionScope scope;
  TransitionScope* previous = currentTransition;
  currentTransition = &scope;

  try {
    body();
  } catch (...) {
    currentTransition = previous;
    runCompletions(scope);
    throw;
  }

  currentTransition = previous;
  runCompletions(scope);
}

class PendingTransition {
public:
  explicit PendingTransition(std::shared_ptr<std::size_t> count) : count_(std::move(count)) {
    ++*count_;
  }

  ~PendingTransition() {
    release();
  }

  PendingTransition(const PendingTransition&) = delete;
  PendingTransition& operator=(const PendingTransition&) = delete;

  void release() noexcept {
    if (count_) {
      --*count_;
      count_.reset();
    }
  }

private:
  std::shared_ptr<std::size_t> count_;
};

bool joinsBatch(const Scheduler& scheduler, const TaskOptions& options) {
  return currentBatch != nullptr && currentBatch->scheduler == &scheduler && options.delayMs <= 0.0 &&
    !options.timeoutMs;
}

} // namespace

TaskHandle startTransition(Scheduler& scheduler, std::function<void()> fn, const TaskOptions& options) {
  if (!fn) {
    throw std::invalid_argument("startTransition requires a callback");
  }

  if (joinsBatch(scheduler, options)) {
    currentBatch->bodies.push_back(std::move(fn));
    return TaskHandle{};
  }

  return scheduleTransition(scheduler, std::move(fn), options);
}

TaskHandle scheduleTransition(Scheduler& scheduler, std::function<void()> fn, const TaskOptions& options) {
  if (!fn) {
    throw std::invalid_argument("scheduleTransition requires a callback");
  }

  return scheduler.scheduleTask(
    TransitionPriority,
    [fn = std::move(fn)]() { runTransitionBody(fn); },
    options);
}

bool isInTransition() noexcept {
  return currentTransition != nullptr;
}

bool onTransitionComplete(std::function<void()> callback) {
  if (currentTransition == nullptr || !callback) {
    return false;
  }
  currentTransition->completions.push_back(std::move(callback));
  return true;
}

TaskHandle batchTransitions(Scheduler& scheduler, const std::function<void()>& fn) {
  if (!fn) {
    throw std::invalid_argument("batchTransitions requires a callback");
  }

  if (currentBatch != nullptr && currentBatch->scheduler == &scheduler) {
    fn();
    return TaskHandle{};
  }

  TransitionBatch batch{&scheduler, {}};
  TransitionBatch* previous = currentBatch;
  currentBatch = &batch;

  try {
    fn();
  } catch (...) {
    currentBatch = previous;
    throw;
  }

  currentBatch = previous;

  if (batch.bodies.empty()) {
    return TaskHandle{};
  }

  return scheduler.scheduleTask(
    TransitionPriority,
    [bodies = std::move(batch.bodies)]() {
      std::exception_ptr firstError;
      for (const auto& body : bodies) {
        try {
          runTransitionBody(body);
        } catch (...) {
          if (!firstError) {
            firstError = std::current_exception();
          }
        }
      }
      if (firstError) {
        std::rethrow_exception(firstError);
      }
    });
}

TransitionTracker::TransitionTracker(Scheduler& scheduler)
  : scheduler_(&scheduler),
    pending_(std::make_shared<std::size_t>(0)) {
}

bool TransitionTracker::isPending() const noexcept {
  return *pending_ > 0;
}

std::size_t TransitionTracker::pendingCount() const noexcept {
  return *pending_;
}

TaskHandle TransitionTracker::start(std::function<void()> fn, const TaskOptions& options) {
  if (!fn) {
    throw std::invalid_argument("TransitionTracker::start requires a callback");
  }

  // Released once the body has run, or when the scheduler destroys the
  // task without running it.
  auto token = std::make_shared<PendingTransition>(pending_);
  auto body = [token, fn = std::move(fn)]() {
    try {
      fn();
    } catch (...) {
      token->release();
      throw;
    }
    token->release();
  };

  return startTransition(*scheduler_, std::move(body), options);
}

TransitionTracker useTransition(Scheduler& scheduler) {
  return TransitionTracker(scheduler);
}

} // namespace kalx
