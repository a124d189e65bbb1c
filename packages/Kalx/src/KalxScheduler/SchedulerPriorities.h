#pragma once

#include "KalxScheduler/Scheduler.h"

#include <cstdint>

namespace kalx {

inline constexpr SchedulerPriority NoPriority = SchedulerPriority::NoPriority;
inline constexpr SchedulerPriority ImmediatePriority = SchedulerPriority::ImmediatePriority;
inline constexpr SchedulerPriority UserBlockingPriority = SchedulerPriority::UserBlockingPriority;
inline constexpr SchedulerPriority NormalPriority = SchedulerPriority::NormalPriority;
inline constexpr SchedulerPriority LowPriority = SchedulerPriority::LowPriority;
inline constexpr SchedulerPriority IdlePriority = SchedulerPriority::IdlePriority;

constexpr bool isValidPriority(SchedulerPriority priority) {
  return priority >= SchedulerPriority::ImmediatePriority && priority <= SchedulerPriority::IdlePriority;
}

constexpr bool isHigherPriority(SchedulerPriority a, SchedulerPriority b) {
  return static_cast<std::uint8_t>(a) < static_cast<std::uint8_t>(b);
}

// How the host loop is asked to run a slice whose head task has a given
// priority. Ordered from fastest to slowest turnaround.
enum class HostDispatchStrategy : std::uint8_t {
  Microtask = 0,
  AnimationFrame = 1,
  IdleCallback = 2,
};

constexpr HostDispatchStrategy dispatchStrategyFor(SchedulerPriority priority) {
  switch (priority) {
    case SchedulerPriority::ImmediatePriority:
    case SchedulerPriority::UserBlockingPriority:
      return HostDispatchStrategy::Microtask;
    case SchedulerPriority::IdlePriority:
      return HostDispatchStrategy::IdleCallback;
    case SchedulerPriority::NormalPriority:
    case SchedulerPriority::LowPriority:
    case SchedulerPriority::NoPriority:
    default:
      return HostDispatchStrategy::AnimationFrame;
  }
}

constexpr const char* priorityName(SchedulerPriority priority) {
  switch (priority) {
    case SchedulerPriority::NoPriority:
      return "NoPriority";
    case SchedulerPriority::ImmediatePriority:
      return "ImmediatePriority";
    case SchedulerPriority::UserBlockingPriority:
      return "UserBlockingPriority";
    case SchedulerPriority::NormalPriority:
      return "NormalPriority";
    case SchedulerPriority::LowPriority:
      return "LowPriority";
    case SchedulerPriority::IdlePriority:
      return "IdlePriority";
    default:
      return "Unknown";
  }
}

} // namespace kalx
