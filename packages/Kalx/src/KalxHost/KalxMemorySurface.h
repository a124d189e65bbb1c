#pragma once

#include "KalxHost/KalxHostInstance.h"
#include "KalxHost/KalxHostInterface.h"

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace kalx {

/**
 * In-process host surface that keeps a tree of KalxHostInstance objects
 * under a root container. Operations naming an unknown ref, or asking for
 * something the target instance cannot do, throw std::invalid_argument or
 * std::logic_error and leave the tree as it was before that operation.
 * commit() goes further and restores the tree as it was before the pass;
 * instances are then new objects holding the same state.
 */
class KalxMemorySurface final : public HostSurface {
public:
  KalxMemorySurface();

  void createNode(const NodePtr& node, HostRef parent, HostRef before) override;
  void removeNode(HostRef ref) override;
  void updateProps(HostRef ref, const PropList& removed, const PropList& changed) override;
  void updateText(HostRef ref, const std::string& text) override;
  void moveNode(HostRef ref, HostRef before) override;
  void retainNodes(const std::vector<RetainedNode>& retained) override;
  void commit(const ReconcileResult& result) override;

  [[nodiscard]] const KalxHostInstancePtr& container() const noexcept;
  [[nodiscard]] KalxHostInstancePtr find(HostRef ref) const;
  [[nodiscard]] std::size_t instanceCount() const noexcept;

  // Runs the handler bound for `event` on the instance. Returns false if
  // none is bound.
  bool dispatchEvent(HostRef ref, const std::string& event);

  [[nodiscard]] std::string serialize() const;

private:
  KalxHostInstancePtr instantiate(const NodePtr& node);
  void registerSubtree(const KalxHostInstancePtr& instance);
  void unregisterSubtree(const KalxHostInstancePtr& instance);
  void restore(KalxHostInstancePtr container);
  KalxHostInstancePtr require(HostRef ref, const char* operation) const;

  void detachFromParent(const KalxHostInstancePtr& child);
  void insertHostChildBefore(
    const KalxHostInstancePtr& parent,
    const KalxHostInstancePtr& child,
    const KalxHostInstancePtr& beforeChild);

  KalxHostInstancePtr container_;
  std::unordered_map<HostRef, KalxHostInstancePtr> instances_;
};

} // namespace kalx
