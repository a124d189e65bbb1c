#include "KalxReconciler/KalxNode.h"

#include <utility>

namespace kalx {

NodePtr createElement(
    std::string tag,
    PropList props,
    NodeList children,
    std::optional<std::string> key,
    PatchDescriptor patchDescriptor) {
  auto node = std::make_shared<Node>();
  node->kind = NodeKind::Element;
  node->tag = std::move(tag);
  node->props = std::move(props);
  node->children = std::move(children);
  node->key = std::move(key);
  node->patchDescriptor = patchDescriptor;
  return node;
}

NodePtr createText(std::string text, std::optional<std::string> key) {
  auto node = std::make_shared<Node>();
  node->kind = NodeKind::Text;
  node->text = std::move(text);
  node->key = std::move(key);
  return node;
}

NodePtr createFragment(NodeList children, std::optional<std::string> key, PatchDescriptor patchDescriptor) {
  auto node = std::make_shared<Node>();
  node->kind = NodeKind::Fragment;
  node->children = std::move(children);
  node->key = std::move(key);
  node->patchDescriptor = patchDescriptor;
  return node;
}

const char* nodeKindName(NodeKind kind) noexcept {
  switch (kind) {
    case NodeKind::Element:
      return "element";
    case NodeKind::Text:
      return "text";
    case NodeKind::Fragment:
      return "fragment";
  }
  return "unknown";
}

bool isSameNodeType(const Node& a, const Node& b) noexcept {
  if (a.kind != b.kind) {
    return false;
  }
  return a.kind != NodeKind::Element || a.tag == b.tag;
}

std::string describeNode(const Node& node) {
  std::string keySuffix = node.key ? " key=" + *node.key : std::string{};
  switch (node.kind) {
    case NodeKind::Text:
      return "#text{" + node.text + "}" + keySuffix;
    case NodeKind::Fragment:
      return "<>" + keySuffix;
    case NodeKind::Element:
      break;
  }
  return "<" + node.tag + keySuffix + ">";
}

} // namespace kalx
