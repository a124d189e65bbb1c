#pragma once

#include "KalxHost/KalxHostInterface.h"
#include "KalxReconciler/KalxMutation.h"
#include "KalxReconciler/KalxNode.h"
#include "KalxScheduler/Scheduler.h"
#include "KalxScheduler/SchedulerPriorities.h"

#include <cstddef>
#include <functional>

namespace kalx {

using RenderFunction = std::function<NodePtr()>;

/**
 * Owns the committed tree of one host surface and turns render requests into
 * scheduled render passes.
 *
 * A pass renders, diffs against the committed tree, and commits. If the
 * slice is used up after diffing (and the task has not expired), the commit
 * continues in a later slice. At most one pass is pending: a new request
 * replaces the previous one. A pass whose render function or diff throws
 * reports the error, leaves the surface untouched and rethrows.
 *
 * The scheduler and the surface must outlive the root.
 */
class KalxRenderRoot {
public:
  KalxRenderRoot(Scheduler& scheduler, HostSurface& surface);
  ~KalxRenderRoot();

  KalxRenderRoot(const KalxRenderRoot&) = delete;
  KalxRenderRoot& operator=(const KalxRenderRoot&) = delete;

  TaskHandle scheduleRender(
    RenderFunction render,
    SchedulerPriority priority = SchedulerPriority::NormalPriority,
    const TaskOptions& options = {});

  // Diffs and commits `tree` now, replacing any pending pass.
  void renderSync(NodePtr tree);

  void cancelPendingRender();

  /**
   * Runs `fn` and turns every scheduleRender() it makes into one pass that
   * renders with the last function requested, at the most urgent priority
   * requested. Returns that pass's handle, or an empty handle if nothing
   * was requested. Nested batches fold into the outermost one.
   */
  TaskHandle batchUpdates(const std::function<void()>& fn);

  [[nodiscard]] const NodePtr& current() const noexcept;
  [[nodiscard]] bool hasPendingRender() const noexcept;
  [[nodiscard]] std::size_t commitCount() const noexcept;

private:
  TaskResult performRender(const RenderFunction& render, bool didTimeout);
  void commit(const NodePtr& next, const ReconcileResult& result);

  Scheduler& scheduler_;
  HostSurface& surface_;
  NodePtr current_{};
  TaskHandle pending_{};
  std::size_t commitCount_{0};

  std::size_t batchDepth_{0};
  RenderFunction batchedRender_{};
  SchedulerPriority batchedPriority_{SchedulerPriority::NoPriority};
  TaskOptions batchedOptions_{};
};

} // namespace kalx
