#pragma once

namespace kalx {

// Time slice granted to a single flush before the loop yields back to the host.
inline constexpr double frameYieldMs = 5.0;

// Upper bound on how long idle work may wait for the host to become idle.
inline constexpr double idleCallbackTimeoutMs = 1000.0;

// forceFrameRate() rejects rates above this.
inline constexpr double maxFrameRate = 125.0;

// Honour requestPaint() by yielding at the next shouldYield() check.
inline constexpr bool enableRequestPaint = true;

struct SchedulerConfig {
  double frameYieldMs{kalx::frameYieldMs};
  double idleCallbackTimeoutMs{kalx::idleCallbackTimeoutMs};
};

} // namespace kalx
