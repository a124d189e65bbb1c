#include "KalxHost/KalxHostInterface.h"

#include <variant>

namespace kalx {

namespace {

struct MutationApplier {
  HostSurface& surface;

  void operator()(const CreateNode& operation) const {
    surface.createNode(operation.node, operation.parent, operation.before);
  }

  void operator()(const RemoveNode& operation) const {
    surface.removeNode(operation.ref);
  }

  void operator()(const UpdateProps& operation) const {
    surface.updateProps(operation.ref, operation.removed, operation.changed);
  }

  void operator()(const UpdateText& operation) const {
    surface.updateText(operation.ref, operation.text);
  }

  void operator()(const MoveNode& operation) const {
    surface.moveNode(operation.ref, operation.before);
  }
};

} // namespace

void applyMutations(HostSurface& surface, const MutationList& operations) {
  const MutationApplier applier{surface};
  for (const auto& operation : operations) {
    std::visit(applier, operation);
  }
}

void HostSurface::commit(const ReconcileResult& result) {
  applyMutations(*this, result.operations);
  if (!result.retained.empty()) {
    retainNodes(result.retained);
  }
}

void commitReconcileResult(HostSurface& surface, const ReconcileResult& result) {
  surface.commit(result);
}

} // namespace kalx
