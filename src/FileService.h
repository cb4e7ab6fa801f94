#pragma once

#include "PathGuard.h"
#include "QueueLock.h"
#include "Settings.h"
#include "TaskScheduler.h"
#include "TaskStore.h"
#include "Transfer.h"
#include "TransferJob.h"
#include "Trash.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Entry point for everything outside the engine: task creation and
// inspection, the trash, and a plain directory listing.
class FileService final {
public:
  using StoreFactory =
      std::function<std::unique_ptr<TaskStore>(const std::filesystem::path& dbPath)>;

  // An empty factory means the SQLite store at settings.DatabasePath().
  explicit FileService(settings::Settings settings,
                       FsPrimitives primitives = FsPrimitives::Native(),
                       StoreFactory storeFactory = {});
  ~FileService();

  FileService(const FileService&) = delete;
  FileService& operator=(const FileService&) = delete;

  // Opens the task store. The first instance on a database takes the queue
  // lock, marks tasks left over from a previous run as interrupted and starts
  // the worker. Later instances only observe until the owner exits: they can
  // read, cancel and clear tasks but not create them. Task operations fail
  // until this succeeds.
  OpResult Start();
  // Waits for the running task to stop at its next unit; it is recorded as
  // interrupted.
  void Shutdown();
  bool IsStarted() const { return started_.load(); }
  bool OwnsQueue() const { return owner_.load(); }

  OpResult CreateTransferTask(const TransferRequest& request, std::string& taskId);
  OpResult GetTask(const std::string& taskId, std::optional<TaskRecord>& out);
  // limit <= 0 uses the configured default. Active tasks that fall outside
  // the newest-first window are prepended, oldest first.
  OpResult ListTasks(int limit, std::vector<TaskRecord>& out);
  // found=false for unknown ids. Finished tasks are left alone.
  OpResult CancelTask(const std::string& taskId, bool& found);
  OpResult ClearCompletedTasks(int& count);

  OpResult FindConflicts(const std::string& targetPath,
                         const std::vector<std::string>& names,
                         std::vector<std::string>& conflicts);

  OpResult DeleteEntry(const std::string& path, const std::string& name, DeleteOutcome& out);
  OpResult RestoreTrashEntry(const std::string& trashPath, std::string& restoredPath);
  OpResult EmptyTrash();
  OpResult ListTrash(std::vector<TrashEntry>& out);
  OpResult MeasureDeleteImpact(const std::string& path,
                               const std::string& name,
                               DeleteImpact& out);

  // Immediate children, sorted. Dot entries are hidden except inside the
  // trash files area.
  OpResult ListEntries(const std::string& path, std::vector<std::string>& out);

  void PauseQueue();
  void ResumeQueue();
  bool WaitIdle(std::chrono::milliseconds timeout);

private:
  OpResult RequireStarted() const;
  void ExecuteTask(const std::string& taskId);
  // FinishRunning with one retry. Returns whether the row left `running`.
  bool RecordOutcome(const std::string& taskId,
                     TaskStatus status,
                     const std::optional<std::uint64_t>& units,
                     const std::optional<std::string>& error);

  settings::Settings settings_;
  PathGuard guard_;
  Trash trash_;
  FsPrimitives primitives_;
  StoreFactory storeFactory_;
  std::unique_ptr<QueueLock> lock_{};
  std::unique_ptr<TaskStore> store_{};
  std::unique_ptr<TaskScheduler> scheduler_{};
  std::atomic<bool> started_{false};
  std::atomic<bool> owner_{false};
};
