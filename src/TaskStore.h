#pragma once

#include "Transfer.h"
#include "util.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class TaskStatus { Queued, Running, Completed, Failed, Cancelled, Interrupted };

const char* TaskStatusName(TaskStatus status);
bool ParseTaskStatus(const std::string& value, TaskStatus& status);
bool ParseTransferOp(const std::string& value, TransferOp& op);
// Queued and running tasks can still change; everything else is final.
bool IsActiveStatus(TaskStatus status);

struct TaskRecord {
  std::string id;
  TransferOp operation{TransferOp::Copy};
  std::string sourcePath;
  std::string targetPath;
  std::vector<std::string> names;
  std::vector<std::string> overwriteNames;
  TaskStatus status{TaskStatus::Queued};
  std::uint64_t processedUnits{0};
  std::uint64_t totalUnits{0};
  std::optional<std::string> currentItem;
  std::optional<std::string> error;
  bool cancelRequested{false};
  std::string createdAt;
  std::optional<std::string> startedAt;
  std::optional<std::string> finishedAt;
  std::string updatedAt;
};

// Durable task records. Every state change that races with another thread is
// conditional on the current status and reports whether it applied.
class TaskStore {
public:
  virtual ~TaskStore() = default;

  virtual OpResult Open() = 0;
  virtual OpResult InitSchema() = 0;

  virtual OpResult Insert(const TaskRecord& record) = 0;
  virtual OpResult Find(const std::string& id, std::optional<TaskRecord>& out) = 0;
  // Newest first.
  virtual OpResult ListRecent(int limit, std::vector<TaskRecord>& out) = 0;
  // Queued and running tasks, oldest first.
  virtual OpResult ListActive(std::vector<TaskRecord>& out) = 0;

  // queued -> running. Clears error, current item and the cancel flag.
  virtual OpResult ClaimQueued(const std::string& id, bool& claimed) = 0;
  virtual OpResult UpdateProgress(const std::string& id,
                                  std::uint64_t processed,
                                  std::uint64_t total,
                                  const std::optional<std::string>& currentItem) = 0;
  // running -> status. `units` sets both counters (completion only).
  virtual OpResult FinishRunning(const std::string& id,
                                 TaskStatus status,
                                 const std::optional<std::uint64_t>& units,
                                 const std::optional<std::string>& error,
                                 bool& finished) = 0;
  // queued -> cancelled with the cancel flag set.
  virtual OpResult CancelQueued(const std::string& id, bool& cancelled) = 0;
  // Sets the cancel flag of a running task.
  virtual OpResult RequestCancel(const std::string& id, bool& requested) = 0;
  // True when the task is gone, no longer running, or flagged.
  virtual OpResult IsCancelRequested(const std::string& id, bool& cancel) = 0;

  // Every queued/running record becomes interrupted with `message`.
  virtual OpResult MarkStaleInterrupted(const std::string& message, int& count) = 0;
  virtual OpResult DeleteCompleted(int& count) = 0;
};
