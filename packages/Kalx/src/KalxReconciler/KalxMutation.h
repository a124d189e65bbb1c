#pragma once

#include "KalxReconciler/KalxNode.h"
#include "KalxReconciler/KalxNodeProps.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace kalx {

/**
 * Opaque handle for a host instance, derived from the identity of the node
 * the instance was created from. A null ref stands for the root container in
 * a parent position and for "append" in a before position.
 *
 * A ref is only meaningful while its node is alive.
 */
class HostRef {
public:
  constexpr HostRef() noexcept = default;

  static HostRef of(const Node& node) noexcept {
    HostRef ref;
    ref.value_ = reinterpret_cast<std::uintptr_t>(&node);
    return ref;
  }

  static HostRef of(const NodePtr& node) noexcept {
    return node ? of(*node) : HostRef{};
  }

  [[nodiscard]] constexpr std::uintptr_t value() const noexcept {
    return value_;
  }

  constexpr explicit operator bool() const noexcept {
    return value_ != 0;
  }

  friend constexpr bool operator==(HostRef a, HostRef b) noexcept {
    return a.value_ == b.value_;
  }

  friend constexpr bool operator!=(HostRef a, HostRef b) noexcept {
    return a.value_ != b.value_;
  }

private:
  std::uintptr_t value_{0};
};

// Builds `node` and its whole subtree under `parent`, before `before`.
struct CreateNode {
  NodePtr node;
  HostRef parent;
  HostRef before;
};

struct RemoveNode {
  HostRef ref;
};

// `removed` carries the old props to unset, `changed` the new props to set.
// A re-bound event handler appears in both.
struct UpdateProps {
  HostRef ref;
  PropList removed;
  PropList changed;
};

struct UpdateText {
  HostRef ref;
  std::string text;
};

// Repositions `ref` among its current siblings, before `before`.
struct MoveNode {
  HostRef ref;
  HostRef before;
};

using MutationOperation = std::variant<CreateNode, RemoveNode, UpdateProps, UpdateText, MoveNode>;
using MutationList = std::vector<MutationOperation>;

// An instance that survives the pass: once the operations are applied it
// must answer to `next` instead of `previous`.
struct RetainedNode {
  HostRef previous;
  HostRef next;
};

struct ReconcileResult {
  MutationList operations;
  std::vector<RetainedNode> retained;
};

[[nodiscard]] std::string describeHostRef(HostRef ref);
[[nodiscard]] std::string describeMutation(const MutationOperation& operation);

} // namespace kalx

namespace std {

template <>
struct hash<kalx::HostRef> {
  std::size_t operator()(kalx::HostRef ref) const noexcept {
    return std::hash<std::uintptr_t>{}(ref.value());
  }
};

} // namespace std
