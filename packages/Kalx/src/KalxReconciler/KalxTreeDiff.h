#pragma once

#include "KalxReconciler/KalxMutation.h"
#include "KalxReconciler/KalxNode.h"

namespace kalx {

/**
 * Computes the operations that turn the host output of `previous` into that
 * of `next`. Either tree may be null (nothing rendered). Neither tree is
 * modified and the result depends only on the two trees.
 *
 * Operations address existing instances by the HostRef of their node in
 * `previous`; created subtrees get the refs of their nodes in `next`.
 * `retained` lists every instance carried over from a `previous` node to a
 * distinct `next` node, so the host can rekey it after applying.
 *
 * Throws ReconciliationError if either tree is malformed; nothing is
 * returned in that case.
 */
ReconcileResult reconcile(const NodePtr& previous, const NodePtr& next);

// The operation list of reconcile().
MutationList diff(const NodePtr& previous, const NodePtr& next);

} // namespace kalx
