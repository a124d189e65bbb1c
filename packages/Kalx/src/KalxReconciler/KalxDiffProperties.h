#pragma once

#include "KalxReconciler/KalxNodeProps.h"
#include "KalxReconciler/KalxPatchFlags.h"

namespace kalx {

struct PropsDiff {
  PropList removed;
  PropList changed;

  [[nodiscard]] bool empty() const noexcept {
    return removed.empty() && changed.empty();
  }
};

/**
 * Compares two prop lists slot by slot.
 *
 * `removed` holds previous props whose slot is gone (and the old side of a
 * re-bound event handler); `changed` holds next props that are new or differ.
 * Both keep the order of the list they came from. When `descriptor` is an
 * optimized hint, only the prop categories it flags are compared.
 */
PropsDiff diffProperties(const PropList& prevProps, const PropList& nextProps, PatchDescriptor descriptor = {});

} // namespace kalx
