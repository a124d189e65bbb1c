#pragma once

#include "KalxScheduler/Scheduler.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace kalx {

/**
 * Raised out of the work loop when a task callback throws.
 * The original exception is attached with std::throw_with_nested and can be
 * recovered with std::rethrow_if_nested.
 */
class SchedulingError : public std::runtime_error {
public:
  SchedulingError(std::uint64_t taskId, SchedulerPriority priority, const std::string& message);

  [[nodiscard]] std::uint64_t taskId() const noexcept;
  [[nodiscard]] SchedulerPriority priority() const noexcept;

private:
  std::uint64_t taskId_;
  SchedulerPriority priority_;
};

/**
 * Raised by the differ when a tree violates the node contract
 * (duplicate sibling keys, missing tag, malformed text node, ...).
 */
class ReconciliationError : public std::logic_error {
public:
  explicit ReconciliationError(const std::string& message);
};

} // namespace kalx
