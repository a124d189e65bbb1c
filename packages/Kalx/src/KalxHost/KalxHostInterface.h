#pragma once

#include "KalxReconciler/KalxMutation.h"
#include "KalxReconciler/KalxNode.h"
#include "KalxReconciler/KalxNodeProps.h"

#include <string>
#include <vector>

namespace kalx {

/**
 * The host toolkit as seen by the reconciler: the five mutation primitives
 * plus ref rebinding for instances carried across a pass. A null parent ref
 * means the root container; a null before ref means append.
 */
class HostSurface {
public:
  HostSurface() = default;
  virtual ~HostSurface() = default;

  virtual void createNode(const NodePtr& node, HostRef parent, HostRef before) = 0;
  virtual void removeNode(HostRef ref) = 0;
  virtual void updateProps(HostRef ref, const PropList& removed, const PropList& changed) = 0;
  virtual void updateText(HostRef ref, const std::string& text) = 0;
  virtual void moveNode(HostRef ref, HostRef before) = 0;

  // All rebinds of one pass take effect together.
  virtual void retainNodes(const std::vector<RetainedNode>& retained) = 0;

  // Applies the operations, then the rebinds. Surfaces that can restore
  // their state override this so a rejected pass leaves nothing applied.
  virtual void commit(const ReconcileResult& result);
};

// Applies the operations in order. Stops at the first one the surface rejects.
void applyMutations(HostSurface& surface, const MutationList& operations);

// Commits one pass through HostSurface::commit.
void commitReconcileResult(HostSurface& surface, const ReconcileResult& result);

} // namespace kalx
