#include "KalxReconciler/KalxDiffProperties.h"

#include "shared/KalxFeatureFlags.h"

#include <string>
#include <unordered_map>

namespace kalx {

namespace {

bool categoryIsDynamic(PropCategory category, PatchDescriptor descriptor) {
  if (!enablePatchFlagFastPath || !descriptor.isOptimized()) {
    return true;
  }
  switch (category) {
    case PropCategory::Class:
      return descriptor.hasDynamicClass();
    case PropCategory::Style:
      return descriptor.hasDynamicStyle();
    case PropCategory::Props:
      return descriptor.hasDynamicProps();
    case PropCategory::Events:
      return descriptor.hasEvents();
  }
  return true;
}

std::unordered_map<std::string, const Prop*> indexBySlot(const PropList& props) {
  std::unordered_map<std::string, const Prop*> slots;
  slots.reserve(props.size());
  for (const auto& prop : props) {
    slots.emplace(propKey(prop), &prop);
  }
  return slots;
}

} // namespace

PropsDiff diffProperties(const PropList& prevProps, const PropList& nextProps, PatchDescriptor descriptor) {
  PropsDiff diff;
  if (&prevProps == &nextProps) {
    return diff;
  }

  const auto prevSlots = indexBySlot(prevProps);
  const auto nextSlots = indexBySlot(nextProps);

  for (const auto& prevProp : prevProps) {
    if (!categoryIsDynamic(propCategory(prevProp), descriptor)) {
      continue;
    }
    if (nextSlots.find(propKey(prevProp)) == nextSlots.end()) {
      diff.removed.push_back(prevProp);
    }
  }

  for (const auto& nextProp : nextProps) {
    if (!categoryIsDynamic(propCategory(nextProp), descriptor)) {
      continue;
    }
    auto prev = prevSlots.find(propKey(nextProp));
    if (prev == prevSlots.end()) {
      diff.changed.push_back(nextProp);
      continue;
    }
    const Prop& prevProp = *prev->second;
    if (prevProp == nextProp) {
      continue;
    }
    if (std::holds_alternative<EventBinding>(prevProp)) {
      // Detach the old handler before the new one is attached.
      diff.removed.push_back(prevProp);
    }
    diff.changed.push_back(nextProp);
  }

  return diff;
}

} // namespace kalx
