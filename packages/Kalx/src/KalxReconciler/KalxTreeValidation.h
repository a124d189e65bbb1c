#pragma once

#include "KalxReconciler/KalxNode.h"

namespace kalx {

/**
 * Checks the structural contract of a render tree and throws
 * ReconciliationError on the first violation:
 * - a null child
 * - an element without a tag
 * - a text node with children or props, or a fragment with props
 * - two props on one node occupying the same slot
 * - two siblings with the same key
 * - the same node instance reached twice (host refs are node identities)
 *
 * A null root is a valid, empty tree.
 */
void validateTree(const NodePtr& root);

} // namespace kalx
