#pragma once

namespace kalx {

// Trust compiler patch descriptors and compare only the prop categories a
// node flags as dynamic. When false every node gets a full props diff
// (hoisted nodes are still skipped).
inline constexpr bool enablePatchFlagFastPath = true;

// Validate both trees before diffing so malformed input is reported as a
// ReconciliationError instead of producing a partial operation list.
inline constexpr bool enableTreeValidation = true;

} // namespace kalx
