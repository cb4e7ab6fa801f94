#pragma once

#include "TaskStore.h"

#include <sqlite3.h>

#include <filesystem>
#include <memory>
#include <mutex>

class SqliteTaskStore final : public TaskStore {
public:
  explicit SqliteTaskStore(const std::filesystem::path& dbPath);
  ~SqliteTaskStore() override;

  SqliteTaskStore(const SqliteTaskStore&) = delete;
  SqliteTaskStore& operator=(const SqliteTaskStore&) = delete;

  // Creates the parent directory when missing. The connection is serialized
  // and shared by the caller threads and the worker.
  OpResult Open() override;

  OpResult InitSchema() override;

  OpResult Insert(const TaskRecord& record) override;
  OpResult Find(const std::string& id, std::optional<TaskRecord>& out) override;
  OpResult ListRecent(int limit, std::vector<TaskRecord>& out) override;
  OpResult ListActive(std::vector<TaskRecord>& out) override;

  OpResult ClaimQueued(const std::string& id, bool& claimed) override;
  OpResult UpdateProgress(const std::string& id,
                          std::uint64_t processed,
                          std::uint64_t total,
                          const std::optional<std::string>& currentItem) override;
  OpResult FinishRunning(const std::string& id,
                         TaskStatus status,
                         const std::optional<std::uint64_t>& units,
                         const std::optional<std::string>& error,
                         bool& finished) override;
  OpResult CancelQueued(const std::string& id, bool& cancelled) override;
  OpResult RequestCancel(const std::string& id, bool& requested) override;
  OpResult IsCancelRequested(const std::string& id, bool& cancel) override;

  OpResult MarkStaleInterrupted(const std::string& message, int& count) override;
  OpResult DeleteCompleted(int& count) override;

private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
  };
  using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

  OpResult Exec(const char* sql);
  OpResult Prepare(const char* sql, Stmt& out);
  OpResult StepDone(Stmt& stmt);
  OpResult Error(const char* context) const;
  OpResult LoadNames(TaskRecord& record);
  OpResult QueryRecords(Stmt& stmt, std::vector<TaskRecord>& out);

  std::filesystem::path dbPath_;
  sqlite3* db_{nullptr};
  std::mutex mutex_;
};
