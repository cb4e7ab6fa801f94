#include "FileService.h"

#include "Overwrite.h"
#include "SqliteTaskStore.h"

#include <wx/log.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <random>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace {
constexpr const char* kRestartedMessage = "Process restarted before task completion";
constexpr const char* kStoppedMessage = "Process stopped before task completion";
constexpr const char* kObserverMessage = "Task queue is owned by another tandem process";

std::string GenerateTaskId() {
  static std::atomic<unsigned long> counter{0};
  thread_local std::mt19937 rng{std::random_device{}()};
  const auto n = ++counter;
  std::ostringstream oss;
  oss << "t" << std::hex << NowMillis() << "-" << n << "-" << (rng() & 0xffffu);
  return oss.str();
}

// Persists every progress step before the engine moves on, and turns both
// user cancellation and service shutdown into a cancel request.
class StoreProgressSink final : public ProgressSink {
public:
  StoreProgressSink(TaskStore& store, std::string taskId, const TaskScheduler& scheduler)
      : store_(store), taskId_(std::move(taskId)), scheduler_(scheduler) {}

  bool ShouldCancel() override {
    if (scheduler_.Stopping()) {
      stopped_ = true;
      return true;
    }
    bool cancel = true;
    const auto res = store_.IsCancelRequested(taskId_, cancel);
    if (!res.ok) {
      wxLogWarning("Task %s: cannot read cancel flag: %s", taskId_, res.message);
      return false;
    }
    return cancel;
  }

  OpResult OnProgress(std::uint64_t processed,
                      std::uint64_t total,
                      const std::string& currentItem) override {
    total_ = total;
    std::optional<std::string> item;
    if (!currentItem.empty()) item = currentItem;
    return store_.UpdateProgress(taskId_, processed, total, item);
  }

  bool StoppedByShutdown() const { return stopped_; }
  std::uint64_t Total() const { return total_; }

private:
  TaskStore& store_;
  std::string taskId_;
  const TaskScheduler& scheduler_;
  bool stopped_{false};
  std::uint64_t total_{0};
};

wxString Describe(const TaskRecord& t) {
  std::string names;
  for (const auto& n : t.names) {
    if (!names.empty()) names += ", ";
    names += n;
  }
  return wxString::Format("%s %s from '%s' to '%s'", TransferOpName(t.operation),
                          wxString::FromUTF8(names), wxString::FromUTF8(t.sourcePath),
                          wxString::FromUTF8(t.targetPath));
}
}  // namespace

FileService::FileService(settings::Settings settings,
                         FsPrimitives primitives,
                         StoreFactory storeFactory)
    : settings_(std::move(settings)),
      guard_(settings_.root),
      trash_(guard_),
      primitives_(std::move(primitives)),
      storeFactory_(std::move(storeFactory)) {}

FileService::~FileService() { Shutdown(); }

OpResult FileService::RequireStarted() const {
  if (!started_.load()) return FailResult("Service not started");
  return OkResult();
}

OpResult FileService::Start() {
  if (started_.load()) return OkResult();

  std::error_code ec;
  if (!fs::is_directory(guard_.Root(), ec)) {
    return FailResult("Root directory does not exist: " + FromPath(guard_.Root()));
  }

  const auto dbPath = settings_.DatabasePath();
  auto lock = std::make_unique<QueueLock>(fs::path(dbPath.string() + ".lock"));
  bool owner = false;
  auto res = lock->TryAcquire(owner);
  if (!res.ok) return res;

  std::unique_ptr<TaskStore> store =
      storeFactory_ ? storeFactory_(dbPath) : std::make_unique<SqliteTaskStore>(dbPath);
  if (!store) return FailResult("No task store for " + FromPath(dbPath));
  res = store->Open();
  if (!res.ok) return res;
  res = store->InitSchema();
  if (!res.ok) return res;

  if (!owner) {
    // Rows marked queued/running belong to the live owner; leave them alone.
    store_ = std::move(store);
    started_.store(true);
    wxLogMessage("Task queue is owned by another process (%s), observing only",
                 FromPath(lock->Path()));
    return OkResult();
  }

  int stale = 0;
  res = store->MarkStaleInterrupted(kRestartedMessage, stale);
  if (!res.ok) return res;
  if (stale > 0) wxLogMessage("Marked %d unfinished task(s) as interrupted", stale);

  res = trash_.EnsureDirectories();
  if (!res.ok) return res;

  lock_ = std::move(lock);
  store_ = std::move(store);
  scheduler_ = std::make_unique<TaskScheduler>(
      [this](const std::string& taskId) { ExecuteTask(taskId); });
  scheduler_->Start();
  owner_.store(true);
  started_.store(true);

  wxLogMessage("Service started on %s", FromPath(guard_.Root()));
  wxLogVerbose("Task store: %s", FromPath(settings_.DatabasePath()));
  return OkResult();
}

void FileService::Shutdown() {
  if (!started_.exchange(false)) return;
  if (scheduler_) {
    scheduler_->Stop();
    scheduler_.reset();
  }
  store_.reset();
  owner_.store(false);
  if (lock_) {
    lock_->Release();
    lock_.reset();
  }
  wxLogVerbose("Service stopped");
}

OpResult FileService::CreateTransferTask(const TransferRequest& request, std::string& taskId) {
  taskId.clear();
  auto res = RequireStarted();
  if (!res.ok) return res;
  if (!owner_.load()) return FailResult(kObserverMessage);

  TransferRequest normalized = request;
  normalized.sourcePath = NormalizeRelativePath(request.sourcePath);
  normalized.targetPath = NormalizeRelativePath(request.targetPath);
  res = NormalizeRequest(normalized);
  if (!res.ok) return res;

  PreparedTransfer prepared;
  res = PrepareTransfer(guard_, normalized, false, prepared);
  if (!res.ok) return res;

  TaskRecord record;
  record.id = GenerateTaskId();
  record.operation = normalized.operation;
  record.sourcePath = normalized.sourcePath;
  record.targetPath = normalized.targetPath;
  record.names = normalized.names;
  record.overwriteNames = normalized.overwriteNames;
  record.createdAt = NowTimestamp();
  record.updatedAt = record.createdAt;

  res = store_->Insert(record);
  if (!res.ok) return res;

  scheduler_->Enqueue(record.id);
  wxLogMessage("Task %s queued: %s", record.id, Describe(record));
  taskId = record.id;
  return OkResult();
}

void FileService::ExecuteTask(const std::string& taskId) {
  bool claimed = false;
  auto res = store_->ClaimQueued(taskId, claimed);
  if (!res.ok) {
    wxLogError("Task %s: cannot claim: %s", taskId, res.message);
    return;
  }
  if (!claimed) {
    wxLogVerbose("Task %s is no longer queued", taskId);
    return;
  }

  std::optional<TaskRecord> record;
  res = store_->Find(taskId, record);
  if (!res.ok || !record) {
    const wxString why =
        res.ok ? wxString("Task record missing after claim") : "Cannot load task: " + res.message;
    wxLogError("Task %s: %s", taskId, why);
    RecordOutcome(taskId, TaskStatus::Failed, std::nullopt, ToUtf8(why));
    return;
  }
  wxLogMessage("Task %s running: %s", taskId, Describe(*record));

  TransferRequest request;
  request.operation = record->operation;
  request.sourcePath = record->sourcePath;
  request.targetPath = record->targetPath;
  request.names = record->names;
  request.overwriteNames = record->overwriteNames;

  StoreProgressSink sink(*store_, taskId, *scheduler_);
  OpResult result;
  try {
    result = RunTransfer(guard_, request, sink, primitives_);
  } catch (const std::exception& e) {
    result = FailResult(wxString::FromUTF8(e.what()));
  }

  switch (result.failure) {
    case OpFailure::None:
      if (RecordOutcome(taskId, TaskStatus::Completed, sink.Total(), std::nullopt)) {
        wxLogMessage("Task %s completed", taskId);
      }
      break;

    case OpFailure::Canceled:
      if (sink.StoppedByShutdown()) {
        if (RecordOutcome(taskId, TaskStatus::Interrupted, std::nullopt,
                          std::string(kStoppedMessage))) {
          wxLogMessage("Task %s interrupted by shutdown", taskId);
        }
      } else if (RecordOutcome(taskId, TaskStatus::Cancelled, std::nullopt, std::nullopt)) {
        wxLogMessage("Task %s cancelled", taskId);
      }
      break;

    case OpFailure::Failed:
    case OpFailure::SourceCleanupFailed:
      if (RecordOutcome(taskId, TaskStatus::Failed, std::nullopt, ToUtf8(result.message))) {
        wxLogError("Task %s failed: %s", taskId, result.message);
      }
      break;
  }
}

bool FileService::RecordOutcome(const std::string& taskId,
                                TaskStatus status,
                                const std::optional<std::uint64_t>& units,
                                const std::optional<std::string>& error) {
  bool finished = false;
  auto res = store_->FinishRunning(taskId, status, units, error, finished);
  if (!res.ok) {
    wxLogWarning("Task %s: cannot record %s, retrying: %s", taskId, TaskStatusName(status),
                 res.message);
    res = store_->FinishRunning(taskId, status, units, error, finished);
  }
  if (!res.ok) {
    // Left running; the next owner's Start marks it interrupted.
    wxLogError("Task %s: cannot record result: %s", taskId, res.message);
    return false;
  }
  return finished;
}

OpResult FileService::GetTask(const std::string& taskId, std::optional<TaskRecord>& out) {
  out.reset();
  auto res = RequireStarted();
  if (!res.ok) return res;
  return store_->Find(taskId, out);
}

OpResult FileService::ListTasks(int limit, std::vector<TaskRecord>& out) {
  out.clear();
  auto res = RequireStarted();
  if (!res.ok) return res;

  const int window = limit <= 0 ? settings_.listLimit : settings::ClampListLimit(limit);
  std::vector<TaskRecord> recent;
  res = store_->ListRecent(window, recent);
  if (!res.ok) return res;
  std::vector<TaskRecord> active;
  res = store_->ListActive(active);
  if (!res.ok) return res;

  std::unordered_set<std::string> known;
  for (const auto& t : recent) known.insert(t.id);
  for (auto& t : active) {
    if (!known.count(t.id)) out.push_back(std::move(t));
  }
  for (auto& t : recent) out.push_back(std::move(t));
  return OkResult();
}

OpResult FileService::CancelTask(const std::string& taskId, bool& found) {
  found = false;
  auto res = RequireStarted();
  if (!res.ok) return res;

  std::optional<TaskRecord> record;
  res = store_->Find(taskId, record);
  if (!res.ok) return res;
  if (!record) return OkResult();
  found = true;

  bool applied = false;
  switch (record->status) {
    case TaskStatus::Queued:
      if (scheduler_) scheduler_->Remove(taskId);
      res = store_->CancelQueued(taskId, applied);
      if (!res.ok) return res;
      if (applied) {
        wxLogMessage("Task %s cancelled before start", taskId);
        return OkResult();
      }
      // Claimed between the read and the update.
      res = store_->RequestCancel(taskId, applied);
      break;

    case TaskStatus::Running:
      res = store_->RequestCancel(taskId, applied);
      break;

    case TaskStatus::Completed:
    case TaskStatus::Failed:
    case TaskStatus::Cancelled:
    case TaskStatus::Interrupted:
      return OkResult();
  }
  if (!res.ok) return res;
  if (applied) wxLogMessage("Cancel requested for task %s", taskId);
  return OkResult();
}

OpResult FileService::ClearCompletedTasks(int& count) {
  count = 0;
  auto res = RequireStarted();
  if (!res.ok) return res;
  res = store_->DeleteCompleted(count);
  if (res.ok) wxLogVerbose("Cleared %d completed task(s)", count);
  return res;
}

OpResult FileService::FindConflicts(const std::string& targetPath,
                                    const std::vector<std::string>& names,
                                    std::vector<std::string>& conflicts) {
  conflicts.clear();
  fs::path targetDir;
  auto res = guard_.Resolve(targetPath, targetDir);
  if (!res.ok) return res;
  for (const auto& name : names) {
    res = ValidateEntryName(name);
    if (!res.ok) return res;
  }
  conflicts = FindExistingNames(targetDir, names);
  return OkResult();
}

OpResult FileService::DeleteEntry(const std::string& path,
                                  const std::string& name,
                                  DeleteOutcome& out) {
  return trash_.Delete(path, name, out);
}

OpResult FileService::RestoreTrashEntry(const std::string& trashPath, std::string& restoredPath) {
  return trash_.Restore(trashPath, restoredPath);
}

OpResult FileService::EmptyTrash() { return trash_.Empty(); }

OpResult FileService::ListTrash(std::vector<TrashEntry>& out) { return trash_.List(out); }

OpResult FileService::MeasureDeleteImpact(const std::string& path,
                                          const std::string& name,
                                          DeleteImpact& out) {
  return trash_.MeasureDeleteImpact(path, name, out);
}

OpResult FileService::ListEntries(const std::string& path, std::vector<std::string>& out) {
  out.clear();
  if (Trash::IsInsideTrash(path)) {
    auto res = trash_.EnsureDirectories();
    if (!res.ok) return res;
  }

  fs::path dir;
  auto res = guard_.Resolve(path, dir);
  if (!res.ok) return res;

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return FailResult("Path must be a directory");

  const bool includeHidden = Trash::IsInsideTrashFiles(path);
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    auto name = it->path().filename().string();
    if (!includeHidden && !name.empty() && name.front() == '.') continue;
    out.push_back(std::move(name));
  }
  if (ec) return FailResult(FromPath(dir), ec);
  std::sort(out.begin(), out.end());
  return OkResult();
}

void FileService::PauseQueue() {
  if (scheduler_) scheduler_->Pause();
}

void FileService::ResumeQueue() {
  if (scheduler_) scheduler_->Resume();
}

bool FileService::WaitIdle(std::chrono::milliseconds timeout) {
  if (!scheduler_) return true;
  return scheduler_->WaitIdle(timeout);
}
