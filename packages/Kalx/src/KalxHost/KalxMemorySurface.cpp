#include "KalxHost/KalxMemorySurface.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace kalx {

namespace {

KalxHostInstance::Kind instanceKindFor(NodeKind kind) {
  switch (kind) {
    case NodeKind::Text:
      return KalxHostInstance::Kind::Text;
    case NodeKind::Fragment:
      return KalxHostInstance::Kind::Fragment;
    case NodeKind::Element:
      break;
  }
  return KalxHostInstance::Kind::Element;
}

void collectSubtree(const KalxHostInstancePtr& instance, std::vector<KalxHostInstancePtr>& out) {
  out.push_back(instance);
  for (const auto& child : instance->children) {
    collectSubtree(child, out);
  }
}

} // namespace

KalxMemorySurface::KalxMemorySurface()
    : container_(std::make_shared<KalxHostInstance>(KalxHostInstance::Kind::Container, "#container")) {
}

void KalxMemorySurface::createNode(const NodePtr& node, HostRef parent, HostRef before) {
  if (node == nullptr) {
    throw std::invalid_argument("createNode requires a node");
  }

  KalxHostInstancePtr parentInstance = parent ? require(parent, "createNode") : container_;
  if (parentInstance->isTextInstance()) {
    throw std::logic_error("createNode cannot insert into " + parentInstance->debugDescription());
  }
  KalxHostInstancePtr beforeInstance = before ? require(before, "createNode") : nullptr;
  if (beforeInstance && beforeInstance->getParent() != parentInstance) {
    throw std::invalid_argument("createNode anchor is not a child of " + parentInstance->debugDescription());
  }

  KalxHostInstancePtr instance = instantiate(node);
  registerSubtree(instance);
  insertHostChildBefore(parentInstance, instance, beforeInstance);
}

void KalxMemorySurface::removeNode(HostRef ref) {
  KalxHostInstancePtr instance = require(ref, "removeNode");
  detachFromParent(instance);
  unregisterSubtree(instance);
}

void KalxMemorySurface::updateProps(HostRef ref, const PropList& removed, const PropList& changed) {
  KalxHostInstancePtr instance = require(ref, "updateProps");
  if (instance->kind() != KalxHostInstance::Kind::Element) {
    throw std::logic_error("updateProps on " + instance->debugDescription());
  }
  for (const auto& prop : removed) {
    instance->removeProp(prop);
  }
  for (const auto& prop : changed) {
    instance->setProp(prop);
  }
}

void KalxMemorySurface::updateText(HostRef ref, const std::string& text) {
  require(ref, "updateText")->setTextContent(text);
}

void KalxMemorySurface::moveNode(HostRef ref, HostRef before) {
  KalxHostInstancePtr instance = require(ref, "moveNode");
  KalxHostInstancePtr parent = instance->getParent();
  if (!parent) {
    throw std::logic_error("moveNode on detached instance " + instance->debugDescription());
  }
  KalxHostInstancePtr beforeInstance = before ? require(before, "moveNode") : nullptr;
  if (beforeInstance == instance) {
    throw std::invalid_argument("moveNode cannot anchor an instance on itself");
  }
  if (beforeInstance && beforeInstance->getParent() != parent) {
    throw std::invalid_argument("moveNode anchor is not a sibling of " + instance->debugDescription());
  }
  insertHostChildBefore(parent, instance, beforeInstance);
}

void KalxMemorySurface::retainNodes(const std::vector<RetainedNode>& retained) {
  std::vector<std::pair<KalxHostInstancePtr, HostRef>> rebinds;
  rebinds.reserve(retained.size());
  for (const auto& entry : retained) {
    if (entry.previous == entry.next) {
      continue;
    }
    rebinds.emplace_back(require(entry.previous, "retainNodes"), entry.next);
  }

  // Old refs first, so a ref that moves between two instances is not lost.
  for (const auto& [instance, next] : rebinds) {
    instances_.erase(instance->getRef());
  }
  for (const auto& [instance, next] : rebinds) {
    instance->setRef(next);
    instances_[next] = instance;
  }
}

void KalxMemorySurface::commit(const ReconcileResult& result) {
  KalxHostInstancePtr saved = container_->cloneSubtree();
  try {
    HostSurface::commit(result);
  } catch (...) {
    restore(std::move(saved));
    throw;
  }
}

const KalxHostInstancePtr& KalxMemorySurface::container() const noexcept {
  return container_;
}

KalxHostInstancePtr KalxMemorySurface::find(HostRef ref) const {
  auto it = instances_.find(ref);
  return it == instances_.end() ? nullptr : it->second;
}

std::size_t KalxMemorySurface::instanceCount() const noexcept {
  return instances_.size();
}

bool KalxMemorySurface::dispatchEvent(HostRef ref, const std::string& event) {
  EventHandlerPtr handler = require(ref, "dispatchEvent")->getListener(event);
  if (handler == nullptr) {
    return false;
  }
  (*handler)();
  return true;
}

std::string KalxMemorySurface::serialize() const {
  return container_->serialize();
}

KalxHostInstancePtr KalxMemorySurface::instantiate(const NodePtr& node) {
  auto instance = std::make_shared<KalxHostInstance>(instanceKindFor(node->kind), node->tag, node->text);
  instance->setRef(HostRef::of(*node));
  for (const auto& prop : node->props) {
    instance->setProp(prop);
  }
  for (const auto& child : node->children) {
    KalxHostInstancePtr childInstance = instantiate(child);
    instance->children.push_back(childInstance);
    childInstance->setParent(instance);
  }
  return instance;
}

void KalxMemorySurface::registerSubtree(const KalxHostInstancePtr& instance) {
  std::vector<KalxHostInstancePtr> subtree;
  collectSubtree(instance, subtree);
  for (const auto& entry : subtree) {
    if (instances_.count(entry->getRef()) > 0) {
      throw std::invalid_argument("createNode would reuse the live ref of " + entry->debugDescription());
    }
  }
  for (const auto& entry : subtree) {
    instances_.emplace(entry->getRef(), entry);
  }
}

void KalxMemorySurface::unregisterSubtree(const KalxHostInstancePtr& instance) {
  std::vector<KalxHostInstancePtr> subtree;
  collectSubtree(instance, subtree);
  for (const auto& entry : subtree) {
    instances_.erase(entry->getRef());
  }
}

void KalxMemorySurface::restore(KalxHostInstancePtr container) {
  container_ = std::move(container);
  instances_.clear();
  for (const auto& child : container_->children) {
    std::vector<KalxHostInstancePtr> subtree;
    collectSubtree(child, subtree);
    for (const auto& entry : subtree) {
      instances_.emplace(entry->getRef(), entry);
    }
  }
}

KalxHostInstancePtr KalxMemorySurface::require(HostRef ref, const char* operation) const {
  KalxHostInstancePtr instance = find(ref);
  if (!instance) {
    throw std::invalid_argument(std::string(operation) + " names unknown ref " + describeHostRef(ref));
  }
  return instance;
}

void KalxMemorySurface::detachFromParent(const KalxHostInstancePtr& child) {
  auto currentParent = child->getParent();
  if (!currentParent) {
    return;
  }
  auto& siblings = currentParent->children;
  siblings.erase(
    std::remove_if(
      siblings.begin(),
      siblings.end(),
      [&](const KalxHostInstancePtr& candidate) {
        return candidate.get() == child.get();
      }),
    siblings.end());
  child->clearParent();
}

void KalxMemorySurface::insertHostChildBefore(
    const KalxHostInstancePtr& parent,
    const KalxHostInstancePtr& child,
    const KalxHostInstancePtr& beforeChild) {
  detachFromParent(child);

  auto& siblings = parent->children;
  auto it = beforeChild
    ? std::find(siblings.begin(), siblings.end(), beforeChild)
    : siblings.end();
  siblings.insert(it, child);
  child->setParent(parent);
}

} // namespace kalx
