#include "shared/KalxErrors.h"

#include "KalxScheduler/SchedulerPriorities.h"

namespace kalx {

namespace {

std::string formatSchedulingMessage(
    std::uint64_t taskId,
    SchedulerPriority priority,
    const std::string& message) {
  return "Task " + std::to_string(taskId) + " (" + priorityName(priority) + ") failed: " + message;
}

} // namespace

SchedulingError::SchedulingError(
    std::uint64_t taskId,
    SchedulerPriority priority,
    const std::string& message)
    : std::runtime_error(formatSchedulingMessage(taskId, priority, message)),
      taskId_(taskId),
      priority_(priority) {}

std::uint64_t SchedulingError::taskId() const noexcept {
  return taskId_;
}

SchedulerPriority SchedulingError::priority() const noexcept {
  return priority_;
}

ReconciliationError::ReconciliationError(const std::string& message)
    : std::logic_error("Reconciliation failed: " + message) {}

} // namespace kalx
