#include "KalxReconciler/KalxTreeDiff.h"

#include "KalxReconciler/KalxDiffProperties.h"
#include "KalxReconciler/KalxTreeValidation.h"
#include "shared/KalxFeatureFlags.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kalx {

namespace {

constexpr std::ptrdiff_t kUnmatched = -1;

bool canReuse(const Node& previous, const Node& next) {
  return isSameNodeType(previous, next) && previous.key == next.key;
}

std::string childMapKey(const Node& child, std::size_t index) {
  if (child.key) {
    return "k:" + *child.key;
  }
  return "i:" + std::to_string(index);
}

bool anyChildHasKey(const NodeList& children) {
  return std::any_of(children.begin(), children.end(), [](const NodePtr& child) {
    return child->key.has_value();
  });
}

// Marks the new positions whose matched old indices form a longest strictly
// increasing run. Those children keep their place; the rest are moved.
std::vector<bool> stablePositions(const std::vector<std::ptrdiff_t>& sources) {
  std::vector<bool> stable(sources.size(), false);
  std::vector<std::size_t> tails;
  std::vector<std::ptrdiff_t> predecessors(sources.size(), kUnmatched);

  for (std::size_t position = 0; position < sources.size(); ++position) {
    const std::ptrdiff_t source = sources[position];
    if (source == kUnmatched) {
      continue;
    }
    auto slot = std::lower_bound(tails.begin(), tails.end(), source, [&sources](std::size_t tail, std::ptrdiff_t value) {
      return sources[tail] < value;
    });
    if (slot != tails.begin()) {
      predecessors[position] = static_cast<std::ptrdiff_t>(*(slot - 1));
    }
    if (slot == tails.end()) {
      tails.push_back(position);
    } else {
      *slot = position;
    }
  }

  if (tails.empty()) {
    return stable;
  }
  std::ptrdiff_t cursor = static_cast<std::ptrdiff_t>(tails.back());
  while (cursor != kUnmatched) {
    stable[static_cast<std::size_t>(cursor)] = true;
    cursor = predecessors[static_cast<std::size_t>(cursor)];
  }
  return stable;
}

class TreeDiffer {
public:
  explicit TreeDiffer(ReconcileResult& result) : result_(result) {}

  void diffRoot(const NodePtr& previous, const NodePtr& next) {
    if (previous == next) {
      return;
    }
    if (previous == nullptr) {
      emitCreate(next, HostRef{}, HostRef{});
      return;
    }
    if (next == nullptr) {
      emitRemove(previous);
      return;
    }
    collectSharedNodes(*previous, *next);
    if (!canPair(previous, next)) {
      emitRemove(previous);
      emitCreate(next, HostRef{}, HostRef{});
      return;
    }
    patchNode(previous, next);
  }

private:
  // Nodes reachable from both trees keep the ref of their old instance, so
  // they are never patched into another node, and are removed before being
  // created again somewhere else.
  void collectSharedNodes(const Node& previous, const Node& next) {
    std::unordered_set<const Node*> previousNodes;
    collectNodes(previous, previousNodes);
    markShared(next, previousNodes);
  }

  static void collectNodes(const Node& node, std::unordered_set<const Node*>& out) {
    out.insert(&node);
    for (const auto& child : node.children) {
      collectNodes(*child, out);
    }
  }

  void markShared(const Node& node, const std::unordered_set<const Node*>& previousNodes) {
    if (previousNodes.count(&node) > 0) {
      collectNodes(node, shared_);
      return;
    }
    for (const auto& child : node.children) {
      markShared(*child, previousNodes);
    }
  }

  bool isShared(const Node& node) const {
    return !shared_.empty() && shared_.count(&node) > 0;
  }

  bool isRemoved(const Node& node) const {
    return !removed_.empty() && removed_.count(&node) > 0;
  }

  bool containsShared(const Node& node) const {
    if (isShared(node)) {
      return true;
    }
    return std::any_of(node.children.begin(), node.children.end(), [this](const NodePtr& child) {
      return containsShared(*child);
    });
  }

  bool canPair(const NodePtr& previous, const NodePtr& next) const {
    if (previous == next) {
      return true;
    }
    if (isShared(*previous) || isShared(*next)) {
      return false;
    }
    return canReuse(*previous, *next);
  }

  void patchNode(const NodePtr& previous, const NodePtr& next) {
    if (previous == next) {
      return;
    }
    retain(previous, next);

    if (previous->patchDescriptor.isHoisted() && next->patchDescriptor.isHoisted() &&
        !containsShared(*previous) && !containsShared(*next)) {
      retainSubtree(*previous, *next);
      return;
    }

    const HostRef ref = HostRef::of(*previous);
    switch (next->kind) {
      case NodeKind::Text:
        if (previous->text != next->text) {
          result_.operations.emplace_back(UpdateText{ref, next->text});
        }
        return;
      case NodeKind::Element: {
        PropsDiff props = diffProperties(previous->props, next->props, next->patchDescriptor);
        if (!props.empty()) {
          result_.operations.emplace_back(UpdateProps{ref, std::move(props.removed), std::move(props.changed)});
        }
        break;
      }
      case NodeKind::Fragment:
        break;
    }

    reconcileChildren(*previous, *next, ref);
  }

  void reconcileChildren(const Node& previous, const Node& next, HostRef parentRef) {
    if (previous.children.empty() && next.children.empty()) {
      return;
    }
    if (shouldUseKeyedStrategy(previous, next)) {
      reconcileKeyedChildren(previous.children, next.children, parentRef);
    } else {
      reconcilePositionalChildren(previous.children, next.children, parentRef);
    }
  }

  static bool shouldUseKeyedStrategy(const Node& previous, const Node& next) {
    const PatchDescriptor descriptor = next.patchDescriptor;
    if (descriptor.hasKeyedChildren()) {
      return true;
    }
    if (descriptor.hasUnkeyedChildren() || descriptor.hasStableChildren()) {
      return false;
    }
    return anyChildHasKey(previous.children) || anyChildHasKey(next.children);
  }

  void reconcilePositionalChildren(const NodeList& oldChildren, const NodeList& newChildren, HostRef parentRef) {
    const std::size_t common = std::min(oldChildren.size(), newChildren.size());

    for (std::size_t index = 0; index < common; ++index) {
      const NodePtr& oldChild = oldChildren[index];
      const NodePtr& newChild = newChildren[index];
      if (!isRemoved(*oldChild) && canPair(oldChild, newChild)) {
        patchNode(oldChild, newChild);
        continue;
      }
      emitRemove(oldChild);
      // Detaching may take out the sibling that would have been the anchor.
      detachLiveSharedNodes(*newChild);
      emitCreate(newChild, parentRef, liveSiblingAfter(oldChildren, index));
    }

    for (std::size_t index = common; index < oldChildren.size(); ++index) {
      emitRemove(oldChildren[index]);
    }
    for (std::size_t index = common; index < newChildren.size(); ++index) {
      emitCreate(newChildren[index], parentRef, HostRef{});
    }
  }

  HostRef liveSiblingAfter(const NodeList& children, std::size_t index) const {
    for (std::size_t next = index + 1; next < children.size(); ++next) {
      if (!isRemoved(*children[next])) {
        return HostRef::of(*children[next]);
      }
    }
    return HostRef{};
  }

  void reconcileKeyedChildren(const NodeList& oldChildren, const NodeList& newChildren, HostRef parentRef) {
    std::unordered_map<std::string, std::size_t> oldIndexByKey;
    oldIndexByKey.reserve(oldChildren.size());
    for (std::size_t index = 0; index < oldChildren.size(); ++index) {
      if (!isRemoved(*oldChildren[index])) {
        oldIndexByKey.emplace(childMapKey(*oldChildren[index], index), index);
      }
    }

    std::vector<std::ptrdiff_t> sources(newChildren.size(), kUnmatched);
    std::vector<bool> oldMatched(oldChildren.size(), false);
    for (std::size_t position = 0; position < newChildren.size(); ++position) {
      auto match = oldIndexByKey.find(childMapKey(*newChildren[position], position));
      if (match == oldIndexByKey.end()) {
        continue;
      }
      // A type change, or a shared node meeting a different node, is a replacement.
      if (!canPair(oldChildren[match->second], newChildren[position])) {
        continue;
      }
      sources[position] = static_cast<std::ptrdiff_t>(match->second);
      oldMatched[match->second] = true;
    }

    for (std::size_t index = 0; index < oldChildren.size(); ++index) {
      if (!oldMatched[index]) {
        emitRemove(oldChildren[index]);
      }
    }

    for (std::size_t position = 0; position < newChildren.size(); ++position) {
      if (sources[position] != kUnmatched) {
        patchNode(oldChildren[static_cast<std::size_t>(sources[position])], newChildren[position]);
      }
    }

    // Right to left, so every anchor is already in its final place.
    const std::vector<bool> stable = stablePositions(sources);
    auto refAt = [&](std::size_t position) {
      const std::ptrdiff_t source = sources[position];
      return source == kUnmatched ? HostRef::of(*newChildren[position])
                                  : HostRef::of(*oldChildren[static_cast<std::size_t>(source)]);
    };
    for (std::size_t position = newChildren.size(); position-- > 0;) {
      const HostRef before = position + 1 < newChildren.size() ? refAt(position + 1) : HostRef{};
      if (sources[position] == kUnmatched) {
        emitCreate(newChildren[position], parentRef, before);
      } else if (!stable[position]) {
        result_.operations.emplace_back(MoveNode{refAt(position), before});
      }
    }
  }

  void retain(const NodePtr& previous, const NodePtr& next) {
    result_.retained.push_back(RetainedNode{HostRef::of(*previous), HostRef::of(*next)});
  }

  void retainSubtree(const Node& previous, const Node& next) {
    const std::size_t count = std::min(previous.children.size(), next.children.size());
    for (std::size_t index = 0; index < count; ++index) {
      const NodePtr& oldChild = previous.children[index];
      const NodePtr& newChild = next.children[index];
      if (oldChild == newChild) {
        continue;
      }
      retain(oldChild, newChild);
      retainSubtree(*oldChild, *newChild);
    }
  }

  void emitCreate(const NodePtr& node, HostRef parent, HostRef before) {
    detachLiveSharedNodes(*node);
    result_.operations.emplace_back(CreateNode{node, parent, before});
  }

  void emitRemove(const NodePtr& node) {
    if (isRemoved(*node)) {
      return;
    }
    result_.operations.emplace_back(RemoveNode{HostRef::of(*node)});
    markRemoved(*node);
  }

  // A shared node about to be created again must first give up its old
  // instance, wherever that instance still lives.
  void detachLiveSharedNodes(const Node& node) {
    if (shared_.empty()) {
      return;
    }
    if (isShared(node)) {
      if (!isRemoved(node)) {
        result_.operations.emplace_back(RemoveNode{HostRef::of(node)});
        markRemoved(node);
      }
      return;
    }
    for (const auto& child : node.children) {
      detachLiveSharedNodes(*child);
    }
  }

  void markRemoved(const Node& node) {
    if (shared_.empty()) {
      return;
    }
    if (isShared(node)) {
      removed_.insert(&node);
    }
    for (const auto& child : node.children) {
      markRemoved(*child);
    }
  }

  ReconcileResult& result_;
  std::unordered_set<const Node*> shared_;
  std::unordered_set<const Node*> removed_;
};

} // namespace

ReconcileResult reconcile(const NodePtr& previous, const NodePtr& next) {
  if (enableTreeValidation) {
    validateTree(previous);
    validateTree(next);
  }

  ReconcileResult result;
  TreeDiffer differ(result);
  differ.diffRoot(previous, next);
  return result;
}

MutationList diff(const NodePtr& previous, const NodePtr& next) {
  return reconcile(previous, next).operations;
}

} // namespace kalx
