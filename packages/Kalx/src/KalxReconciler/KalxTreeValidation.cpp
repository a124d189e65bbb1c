#include "KalxReconciler/KalxTreeValidation.h"

#include "shared/KalxErrors.h"

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kalx {

namespace {

[[noreturn]] void fail(const std::string& path, const std::string& problem) {
  throw ReconciliationError(problem + " at " + path);
}

void validateProps(const Node& node, const std::string& path) {
  if (node.props.empty()) {
    return;
  }
  if (node.kind == NodeKind::Text) {
    fail(path, "text node cannot carry props");
  }
  if (node.kind == NodeKind::Fragment) {
    fail(path, "fragment cannot carry props");
  }
  std::unordered_set<std::string> slots;
  for (const auto& prop : node.props) {
    if (!slots.insert(propKey(prop)).second) {
      fail(path, "duplicate prop '" + propKey(prop) + "'");
    }
  }
}

} // namespace

void validateTree(const NodePtr& root) {
  if (root == nullptr) {
    return;
  }

  std::unordered_set<const Node*> seen;
  std::vector<std::pair<const Node*, std::string>> stack;
  stack.emplace_back(root.get(), describeNode(*root));

  while (!stack.empty()) {
    auto [node, path] = std::move(stack.back());
    stack.pop_back();

    if (!seen.insert(node).second) {
      fail(path, "node instance used more than once");
    }
    if (node->kind == NodeKind::Element && node->tag.empty()) {
      fail(path, "element without a tag");
    }
    if (node->kind == NodeKind::Text && !node->children.empty()) {
      fail(path, "text node cannot have children");
    }
    validateProps(*node, path);

    std::unordered_set<std::string> keys;
    for (std::size_t index = node->children.size(); index-- > 0;) {
      const NodePtr& child = node->children[index];
      const std::string childPath = path + "/" + std::to_string(index);
      if (child == nullptr) {
        fail(childPath, "null child");
      }
      if (child->key && !keys.insert(*child->key).second) {
        fail(childPath, "duplicate sibling key '" + *child->key + "'");
      }
      stack.emplace_back(child.get(), childPath + ":" + describeNode(*child));
    }
  }
}

} // namespace kalx
