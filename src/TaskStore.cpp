#include "TaskStore.h"

namespace {
constexpr TaskStatus kAllStatuses[] = {TaskStatus::Queued,    TaskStatus::Running,
                                       TaskStatus::Completed, TaskStatus::Failed,
                                       TaskStatus::Cancelled, TaskStatus::Interrupted};
}  // namespace

const char* TaskStatusName(TaskStatus status) {
  switch (status) {
    case TaskStatus::Queued: return "queued";
    case TaskStatus::Running: return "running";
    case TaskStatus::Completed: return "completed";
    case TaskStatus::Failed: return "failed";
    case TaskStatus::Cancelled: return "cancelled";
    case TaskStatus::Interrupted: return "interrupted";
  }
  return "failed";
}

bool ParseTaskStatus(const std::string& value, TaskStatus& status) {
  for (const auto candidate : kAllStatuses) {
    if (value == TaskStatusName(candidate)) {
      status = candidate;
      return true;
    }
  }
  return false;
}

bool ParseTransferOp(const std::string& value, TransferOp& op) {
  if (value == TransferOpName(TransferOp::Copy)) {
    op = TransferOp::Copy;
    return true;
  }
  if (value == TransferOpName(TransferOp::Move)) {
    op = TransferOp::Move;
    return true;
  }
  return false;
}

bool IsActiveStatus(TaskStatus status) {
  return status == TaskStatus::Queued || status == TaskStatus::Running;
}
