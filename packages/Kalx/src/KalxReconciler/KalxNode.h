#pragma once

#include "KalxReconciler/KalxNodeProps.h"
#include "KalxReconciler/KalxPatchFlags.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kalx {

enum class NodeKind : std::uint8_t {
  Element,
  Text,
  Fragment,
};

struct Node;

using NodePtr = std::shared_ptr<const Node>;
using NodeList = std::vector<NodePtr>;

/**
 * One immutable node of a render tree. Every render pass builds a fresh tree;
 * unchanged subtrees may be shared with the previous tree by pointer.
 *
 * `tag` only means something for elements and `text` only for text nodes.
 * Keys need only be unique among siblings.
 */
struct Node {
  NodeKind kind{NodeKind::Element};
  std::string tag{};
  PropList props{};
  NodeList children{};
  std::optional<std::string> key{};
  PatchDescriptor patchDescriptor{};
  std::string text{};
};

NodePtr createElement(
  std::string tag,
  PropList props = {},
  NodeList children = {},
  std::optional<std::string> key = std::nullopt,
  PatchDescriptor patchDescriptor = {});

NodePtr createText(std::string text, std::optional<std::string> key = std::nullopt);

NodePtr createFragment(
  NodeList children,
  std::optional<std::string> key = std::nullopt,
  PatchDescriptor patchDescriptor = {});

[[nodiscard]] const char* nodeKindName(NodeKind kind) noexcept;

// Same kind and, for elements, same tag. Keys are not considered.
[[nodiscard]] bool isSameNodeType(const Node& a, const Node& b) noexcept;

[[nodiscard]] std::string describeNode(const Node& node);

} // namespace kalx
