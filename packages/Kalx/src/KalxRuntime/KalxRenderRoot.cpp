#include "KalxRuntime/KalxRenderRoot.h"

#include "KalxReconciler/KalxTreeDiff.h"
#include "shared/KalxGlobalError.h"

#include <exception>
#include <stdexcept>
#include <utility>

namespace kalx {

KalxRenderRoot::KalxRenderRoot(Scheduler& scheduler, HostSurface& surface)
  : scheduler_(scheduler),
    surface_(surface) {
}

KalxRenderRoot::~KalxRenderRoot() {
  cancelPendingRender();
}

TaskHandle KalxRenderRoot::scheduleRender(
    RenderFunction render,
    SchedulerPriority priority,
    const TaskOptions& options) {
  if (!render) {
    throw std::invalid_argument("scheduleRender requires a render function");
  }

  if (batchDepth_ > 0) {
    batchedRender_ = std::move(render);
    if (batchedPriority_ == SchedulerPriority::NoPriority || isHigherPriority(priority, batchedPriority_)) {
      batchedPriority_ = priority;
      batchedOptions_ = options;
    }
    return TaskHandle{};
  }

  cancelPendingRender();
  pending_ = scheduler_.scheduleCallback(
    priority,
    [this, render = std::move(render)](bool didTimeout) {
      return performRender(render, didTimeout);
    },
    options);
  return pending_;
}

void KalxRenderRoot::renderSync(NodePtr tree) {
  cancelPendingRender();

  ReconcileResult result;
  try {
    result = reconcile(current_, tree);
  } catch (const std::exception& ex) {
    reportGlobalError(ex);
    throw;
  }
  commit(tree, result);
}

void KalxRenderRoot::cancelPendingRender() {
  if (pending_) {
    scheduler_.cancelTask(pending_);
    pending_ = TaskHandle{};
  }
}

TaskHandle KalxRenderRoot::batchUpdates(const std::function<void()>& fn) {
  if (!fn) {
    throw std::invalid_argument("batchUpdates requires a callback");
  }

  ++batchDepth_;
  try {
    fn();
  } catch (...) {
    if (--batchDepth_ == 0) {
      batchedRender_ = nullptr;
      batchedPriority_ = SchedulerPriority::NoPriority;
      batchedOptions_ = TaskOptions{};
    }
    throw;
  }

  if (--batchDepth_ > 0 || !batchedRender_) {
    return TaskHandle{};
  }

  RenderFunction render = std::move(batchedRender_);
  const SchedulerPriority priority = batchedPriority_;
  const TaskOptions options = batchedOptions_;
  batchedRender_ = nullptr;
  batchedPriority_ = SchedulerPriority::NoPriority;
  batchedOptions_ = TaskOptions{};
  return scheduleRender(std::move(render), priority, options);
}

const NodePtr& KalxRenderRoot::current() const noexcept {
  return current_;
}

bool KalxRenderRoot::hasPendingRender() const noexcept {
  return static_cast<bool>(pending_);
}

std::size_t KalxRenderRoot::commitCount() const noexcept {
  return commitCount_;
}

TaskResult KalxRenderRoot::performRender(const RenderFunction& render, bool didTimeout) {
  NodePtr next;
  ReconcileResult result;
  try {
    next = render();
    result = reconcile(current_, next);
  } catch (const std::exception& ex) {
    pending_ = TaskHandle{};
    reportGlobalError(ex);
    throw;
  } catch (...) {
    pending_ = TaskHandle{};
    reportGlobalError();
    throw;
  }

  if (!didTimeout && scheduler_.shouldYield()) {
    // Any newer request cancels this task, so the diff stays valid against
    // current_ until the continuation runs.
    return TaskResult::continueWith([this, next, result](bool) {
      commit(next, result);
      return TaskResult::done();
    });
  }

  commit(next, result);
  return TaskResult::done();
}

void KalxRenderRoot::commit(const NodePtr& next, const ReconcileResult& result) {
  pending_ = TaskHandle{};
  try {
    commitReconcileResult(surface_, result);
  } catch (const std::exception& ex) {
    reportGlobalError(ex);
    throw;
  }
  current_ = next;
  ++commitCount_;
}

} // namespace kalx
