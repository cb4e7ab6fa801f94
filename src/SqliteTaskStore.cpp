#include "SqliteTaskStore.h"

#include <wx/log.h>

#include <system_error>

namespace fs = std::filesystem;

namespace {
constexpr const char* kSchema = R"SQL(
PRAGMA foreign_keys = ON;

CREATE TABLE IF NOT EXISTS task (
    id               TEXT PRIMARY KEY,
    operation        TEXT NOT NULL,
    source_path      TEXT NOT NULL,
    target_path      TEXT NOT NULL,
    status           TEXT NOT NULL DEFAULT 'queued',
    processed_units  INTEGER NOT NULL DEFAULT 0,
    total_units      INTEGER NOT NULL DEFAULT 0,
    current_item     TEXT,
    error            TEXT,
    cancel_requested INTEGER NOT NULL DEFAULT 0,
    created_at       TEXT NOT NULL,
    started_at       TEXT,
    finished_at      TEXT,
    updated_at       TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS task_name (
    task_id   TEXT NOT NULL,
    position  INTEGER NOT NULL,
    name      TEXT NOT NULL,
    overwrite INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY(task_id, position),
    FOREIGN KEY(task_id) REFERENCES task(id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_task_status_created ON task(status, created_at);
CREATE INDEX IF NOT EXISTS idx_task_created ON task(created_at);
)SQL";

constexpr const char* kTaskColumns =
    "SELECT id, operation, source_path, target_path, status, processed_units, total_units, "
    "current_item, error, cancel_requested, created_at, started_at, finished_at, updated_at "
    "FROM task ";

std::string ColumnText(sqlite3_stmt* stmt, int col) {
  const auto* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::optional<std::string> ColumnOptionalText(sqlite3_stmt* stmt, int col) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
  return ColumnText(stmt, col);
}

void BindText(sqlite3_stmt* stmt, int idx, const std::string& value) {
  sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& value) {
  if (value) {
    BindText(stmt, idx, *value);
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

void BindUnits(sqlite3_stmt* stmt, int idx, std::uint64_t value) {
  sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(value));
}

OpResult ReadRecord(sqlite3_stmt* stmt, TaskRecord& out) {
  out.id = ColumnText(stmt, 0);
  if (!ParseTransferOp(ColumnText(stmt, 1), out.operation)) {
    return FailResult("Task " + wxString::FromUTF8(out.id) + " has an unknown operation");
  }
  out.sourcePath = ColumnText(stmt, 2);
  out.targetPath = ColumnText(stmt, 3);
  if (!ParseTaskStatus(ColumnText(stmt, 4), out.status)) {
    return FailResult("Task " + wxString::FromUTF8(out.id) + " has an unknown status");
  }
  out.processedUnits = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 5));
  out.totalUnits = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 6));
  out.currentItem = ColumnOptionalText(stmt, 7);
  out.error = ColumnOptionalText(stmt, 8);
  out.cancelRequested = sqlite3_column_int(stmt, 9) != 0;
  out.createdAt = ColumnText(stmt, 10);
  out.startedAt = ColumnOptionalText(stmt, 11);
  out.finishedAt = ColumnOptionalText(stmt, 12);
  out.updatedAt = ColumnText(stmt, 13);
  return OkResult();
}
}  // namespace

SqliteTaskStore::SqliteTaskStore(const fs::path& dbPath) : dbPath_(dbPath) {}

SqliteTaskStore::~SqliteTaskStore() {
  if (db_) sqlite3_close(db_);
}

OpResult SqliteTaskStore::Error(const char* context) const {
  return FailResult(wxString::Format("%s: %s", context, wxString::FromUTF8(sqlite3_errmsg(db_))));
}

OpResult SqliteTaskStore::Open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_) return OkResult();

  std::error_code ec;
  if (dbPath_.has_parent_path()) {
    fs::create_directories(dbPath_.parent_path(), ec);
    if (ec) return FailResult("Cannot create database directory", ec);
  }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(dbPath_.string().c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    auto res = FailResult(wxString::Format("Cannot open SQLite database %s: %s", FromPath(dbPath_),
                                           wxString::FromUTF8(sqlite3_errmsg(db_))));
    sqlite3_close(db_);
    db_ = nullptr;
    return res;
  }
  sqlite3_busy_timeout(db_, 5000);

  auto res = Exec("PRAGMA foreign_keys = ON;");
  if (!res.ok) return res;
  wxLogVerbose("Opened task store %s", FromPath(dbPath_));
  return OkResult();
}

OpResult SqliteTaskStore::Exec(const char* sql) {
  if (!db_) return FailResult("Task store is not open");
  char* errmsg = nullptr;
  const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
  if (rc != SQLITE_OK) {
    const wxString msg = errmsg ? wxString::FromUTF8(errmsg) : wxString("Unknown SQLite error");
    if (errmsg) sqlite3_free(errmsg);
    return FailResult(msg);
  }
  return OkResult();
}

OpResult SqliteTaskStore::Prepare(const char* sql, Stmt& out) {
  if (!db_) return FailResult("Task store is not open");
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (stmt) sqlite3_finalize(stmt);
    return Error("Cannot prepare statement");
  }
  out.reset(stmt);
  return OkResult();
}

OpResult SqliteTaskStore::StepDone(Stmt& stmt) {
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) return Error("Task store write failed");
  return OkResult();
}

OpResult SqliteTaskStore::InitSchema() {
  std::lock_guard<std::mutex> lock(mutex_);
  return Exec(kSchema);
}

OpResult SqliteTaskStore::Insert(const TaskRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto res = Exec("BEGIN IMMEDIATE;");
  if (!res.ok) return res;

  auto rollback = [this](const OpResult& failure) {
    const auto undo = Exec("ROLLBACK;");
    if (!undo.ok) wxLogWarning("Task store rollback failed: %s", undo.message);
    return failure;
  };

  Stmt stmt;
  res = Prepare(
      "INSERT INTO task (id, operation, source_path, target_path, status, processed_units, "
      "total_units, current_item, error, cancel_requested, created_at, started_at, finished_at, "
      "updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);",
      stmt);
  if (!res.ok) return rollback(res);

  BindText(stmt.get(), 1, record.id);
  BindText(stmt.get(), 2, TransferOpName(record.operation));
  BindText(stmt.get(), 3, record.sourcePath);
  BindText(stmt.get(), 4, record.targetPath);
  BindText(stmt.get(), 5, TaskStatusName(record.status));
  BindUnits(stmt.get(), 6, record.processedUnits);
  BindUnits(stmt.get(), 7, record.totalUnits);
  BindOptionalText(stmt.get(), 8, record.currentItem);
  BindOptionalText(stmt.get(), 9, record.error);
  sqlite3_bind_int(stmt.get(), 10, record.cancelRequested ? 1 : 0);
  BindText(stmt.get(), 11, record.createdAt);
  BindOptionalText(stmt.get(), 12, record.startedAt);
  BindOptionalText(stmt.get(), 13, record.finishedAt);
  BindText(stmt.get(), 14, record.updatedAt);
  res = StepDone(stmt);
  if (!res.ok) return rollback(res);

  Stmt nameStmt;
  res = Prepare("INSERT INTO task_name (task_id, position, name, overwrite) VALUES (?, ?, ?, ?);",
                nameStmt);
  if (!res.ok) return rollback(res);

  for (std::size_t i = 0; i < record.names.size(); ++i) {
    const auto& name = record.names[i];
    bool overwrite = false;
    for (const auto& o : record.overwriteNames) {
      if (o == name) overwrite = true;
    }
    sqlite3_reset(nameStmt.get());
    sqlite3_clear_bindings(nameStmt.get());
    BindText(nameStmt.get(), 1, record.id);
    sqlite3_bind_int(nameStmt.get(), 2, static_cast<int>(i));
    BindText(nameStmt.get(), 3, name);
    sqlite3_bind_int(nameStmt.get(), 4, overwrite ? 1 : 0);
    res = StepDone(nameStmt);
    if (!res.ok) return rollback(res);
  }

  res = Exec("COMMIT;");
  if (!res.ok) return rollback(res);
  return OkResult();
}

OpResult SqliteTaskStore::LoadNames(TaskRecord& record) {
  Stmt stmt;
  auto res = Prepare(
      "SELECT name, overwrite FROM task_name WHERE task_id = ? ORDER BY position;", stmt);
  if (!res.ok) return res;
  BindText(stmt.get(), 1, record.id);

  record.names.clear();
  record.overwriteNames.clear();
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    auto name = ColumnText(stmt.get(), 0);
    if (sqlite3_column_int(stmt.get(), 1) != 0) record.overwriteNames.push_back(name);
    record.names.push_back(std::move(name));
  }
  if (rc != SQLITE_DONE) return Error("Cannot read task names");
  return OkResult();
}

OpResult SqliteTaskStore::QueryRecords(Stmt& stmt, std::vector<TaskRecord>& out) {
  out.clear();
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    TaskRecord record;
    auto res = ReadRecord(stmt.get(), record);
    if (!res.ok) return res;
    out.push_back(std::move(record));
  }
  if (rc != SQLITE_DONE) return Error("Cannot read tasks");

  for (auto& record : out) {
    auto res = LoadNames(record);
    if (!res.ok) return res;
  }
  return OkResult();
}

OpResult SqliteTaskStore::Find(const std::string& id, std::optional<TaskRecord>& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  out.reset();

  Stmt stmt;
  auto res = Prepare((std::string(kTaskColumns) + "WHERE id = ?;").c_str(), stmt);
  if (!res.ok) return res;
  BindText(stmt.get(), 1, id);

  std::vector<TaskRecord> rows;
  res = QueryRecords(stmt, rows);
  if (!res.ok) return res;
  if (!rows.empty()) out = std::move(rows.front());
  return OkResult();
}

OpResult SqliteTaskStore::ListRecent(int limit, std::vector<TaskRecord>& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  Stmt stmt;
  auto res = Prepare(
      (std::string(kTaskColumns) + "ORDER BY created_at DESC, rowid DESC LIMIT ?;").c_str(), stmt);
  if (!res.ok) return res;
  sqlite3_bind_int(stmt.get(), 1, limit);
  return QueryRecords(stmt, out);
}

OpResult SqliteTaskStore::ListActive(std::vector<TaskRecord>& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  Stmt stmt;
  auto res = Prepare((std::string(kTaskColumns) +
                      "WHERE status IN ('queued', 'running') ORDER BY created_at ASC, rowid ASC;")
                         .c_str(),
                     stmt);
  if (!res.ok) return res;
  return QueryRecords(stmt, out);
}

OpResult SqliteTaskStore::ClaimQueued(const std::string& id, bool& claimed) {
  std::lock_guard<std::mutex> lock(mutex_);
  claimed = false;

  Stmt stmt;
  auto res = Prepare(
      "UPDATE task SET status = 'running', started_at = ?, updated_at = ?, error = NULL, "
      "current_item = NULL, cancel_requested = 0 WHERE id = ? AND status = 'queued';",
      stmt);
  if (!res.ok) return res;
  const auto now = NowTimestamp();
  BindText(stmt.get(), 1, now);
  BindText(stmt.get(), 2, now);
  BindText(stmt.get(), 3, id);
  res = StepDone(stmt);
  if (!res.ok) return res;
  claimed = sqlite3_changes(db_) > 0;
  return OkResult();
}

OpResult SqliteTaskStore::UpdateProgress(const std::string& id,
                                         std::uint64_t processed,
                                         std::uint64_t total,
                                         const std::optional<std::string>& currentItem) {
  std::lock_guard<std::mutex> lock(mutex_);
  Stmt stmt;
  auto res = Prepare(
      "UPDATE task SET processed_units = ?, total_units = ?, current_item = ?, updated_at = ? "
      "WHERE id = ? AND status = 'running';",
      stmt);
  if (!res.ok) return res;
  BindUnits(stmt.get(), 1, processed);
  BindUnits(stmt.get(), 2, total);
  BindOptionalText(stmt.get(), 3, currentItem);
  BindText(stmt.get(), 4, NowTimestamp());
  BindText(stmt.get(), 5, id);
  return StepDone(stmt);
}

OpResult SqliteTaskStore::FinishRunning(const std::string& id,
                                        TaskStatus status,
                                        const std::optional<std::uint64_t>& units,
                                        const std::optional<std::string>& error,
                                        bool& finished) {
  std::lock_guard<std::mutex> lock(mutex_);
  finished = false;
  if (IsActiveStatus(status)) return FailResult("Not a terminal status");

  Stmt stmt;
  OpResult res;
  if (units) {
    res = Prepare(
        "UPDATE task SET status = ?, error = ?, current_item = NULL, finished_at = ?, "
        "updated_at = ?, processed_units = ?, total_units = ?, cancel_requested = 0 "
        "WHERE id = ? AND status = 'running';",
        stmt);
  } else {
    res = Prepare(
        "UPDATE task SET status = ?, error = ?, current_item = NULL, finished_at = ?, "
        "updated_at = ? WHERE id = ? AND status = 'running';",
        stmt);
  }
  if (!res.ok) return res;

  const auto now = NowTimestamp();
  int idx = 1;
  BindText(stmt.get(), idx++, TaskStatusName(status));
  BindOptionalText(stmt.get(), idx++, error);
  BindText(stmt.get(), idx++, now);
  BindText(stmt.get(), idx++, now);
  if (units) {
    BindUnits(stmt.get(), idx++, *units);
    BindUnits(stmt.get(), idx++, *units);
  }
  BindText(stmt.get(), idx, id);
  res = StepDone(stmt);
  if (!res.ok) return res;
  finished = sqlite3_changes(db_) > 0;
  return OkResult();
}

OpResult SqliteTaskStore::CancelQueued(const std::string& id, bool& cancelled) {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled = false;

  Stmt stmt;
  auto res = Prepare(
      "UPDATE task SET status = 'cancelled', cancel_requested = 1, finished_at = ?, "
      "updated_at = ?, current_item = NULL, error = NULL WHERE id = ? AND status = 'queued';",
      stmt);
  if (!res.ok) return res;
  const auto now = NowTimestamp();
  BindText(stmt.get(), 1, now);
  BindText(stmt.get(), 2, now);
  BindText(stmt.get(), 3, id);
  res = StepDone(stmt);
  if (!res.ok) return res;
  cancelled = sqlite3_changes(db_) > 0;
  return OkResult();
}

OpResult SqliteTaskStore::RequestCancel(const std::string& id, bool& requested) {
  std::lock_guard<std::mutex> lock(mutex_);
  requested = false;

  Stmt stmt;
  auto res = Prepare(
      "UPDATE task SET cancel_requested = 1, updated_at = ? WHERE id = ? AND status = 'running';",
      stmt);
  if (!res.ok) return res;
  BindText(stmt.get(), 1, NowTimestamp());
  BindText(stmt.get(), 2, id);
  res = StepDone(stmt);
  if (!res.ok) return res;
  requested = sqlite3_changes(db_) > 0;
  return OkResult();
}

OpResult SqliteTaskStore::IsCancelRequested(const std::string& id, bool& cancel) {
  std::lock_guard<std::mutex> lock(mutex_);
  cancel = true;

  Stmt stmt;
  auto res = Prepare("SELECT status, cancel_requested FROM task WHERE id = ?;", stmt);
  if (!res.ok) return res;
  BindText(stmt.get(), 1, id);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) return OkResult();
  if (rc != SQLITE_ROW) return Error("Cannot read task");
  cancel = ColumnText(stmt.get(), 0) != TaskStatusName(TaskStatus::Running) ||
           sqlite3_column_int(stmt.get(), 1) != 0;
  return OkResult();
}

OpResult SqliteTaskStore::MarkStaleInterrupted(const std::string& message, int& count) {
  std::lock_guard<std::mutex> lock(mutex_);
  count = 0;

  Stmt stmt;
  auto res = Prepare(
      "UPDATE task SET status = 'interrupted', finished_at = ?, updated_at = ?, error = ?, "
      "current_item = NULL, cancel_requested = 0 WHERE status IN ('queued', 'running');",
      stmt);
  if (!res.ok) return res;
  const auto now = NowTimestamp();
  BindText(stmt.get(), 1, now);
  BindText(stmt.get(), 2, now);
  BindText(stmt.get(), 3, message);
  res = StepDone(stmt);
  if (!res.ok) return res;
  count = sqlite3_changes(db_);
  return OkResult();
}

OpResult SqliteTaskStore::DeleteCompleted(int& count) {
  std::lock_guard<std::mutex> lock(mutex_);
  count = 0;

  Stmt stmt;
  auto res = Prepare("DELETE FROM task WHERE status = 'completed';", stmt);
  if (!res.ok) return res;
  res = StepDone(stmt);
  if (!res.ok) return res;
  count = sqlite3_changes(db_);
  return OkResult();
}
