#include "SqliteTaskStore.h"
#include "TaskScheduler.h"

#include "TestSupport.h"

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
TaskRecord MakeRecord(const std::string& id,
                      TaskStatus status = TaskStatus::Queued,
                      const std::string& createdAt = "2026-01-01T00:00:00.000Z") {
  TaskRecord r;
  r.id = id;
  r.operation = TransferOp::Move;
  r.sourcePath = "src";
  r.targetPath = "dst";
  r.names = {"b", "a", "c"};
  r.overwriteNames = {"c"};
  r.status = status;
  r.createdAt = createdAt;
  r.updatedAt = createdAt;
  return r;
}

void OpenStore(SqliteTaskStore& store) {
  const auto res = store.Open();
  if (!res.ok) throw std::runtime_error(ToUtf8(res.message));
  const auto schema = store.InitSchema();
  if (!schema.ok) throw std::runtime_error(ToUtf8(schema.message));
}

TaskRecord Load(SqliteTaskStore& store, const std::string& id) {
  std::optional<TaskRecord> out;
  const auto res = store.Find(id, out);
  if (!res.ok) throw std::runtime_error(ToUtf8(res.message));
  if (!out) throw std::runtime_error("missing task " + id);
  return *out;
}
}  // namespace

TEST(status_names_round_trip) {
  for (const auto s : {TaskStatus::Queued, TaskStatus::Running, TaskStatus::Completed,
                       TaskStatus::Failed, TaskStatus::Cancelled, TaskStatus::Interrupted}) {
    TaskStatus parsed{TaskStatus::Failed};
    ASSERT(ParseTaskStatus(TaskStatusName(s), parsed));
    ASSERT(parsed == s);
  }
  TaskStatus parsed{TaskStatus::Queued};
  ASSERT(!ParseTaskStatus("paused", parsed));
  ASSERT(IsActiveStatus(TaskStatus::Running));
  ASSERT(!IsActiveStatus(TaskStatus::Interrupted));
}

TEST(insert_and_find_preserve_names) {
  TempRoot root;
  SqliteTaskStore store(root / "db" / "tasks.db");
  OpenStore(store);
  ASSERT_OK(store.Insert(MakeRecord("t1")));

  const auto t = Load(store, "t1");
  ASSERT(t.operation == TransferOp::Move);
  ASSERT(t.status == TaskStatus::Queued);
  ASSERT_EQ(t.names, (std::vector<std::string>{"b", "a", "c"}));
  ASSERT_EQ(t.overwriteNames, (std::vector<std::string>{"c"}));
  ASSERT(!t.currentItem);
  ASSERT(!t.finishedAt);

  std::optional<TaskRecord> missing;
  ASSERT_OK(store.Find("nope", missing));
  ASSERT(!missing);
}

TEST(duplicate_insert_fails_cleanly) {
  TempRoot root;
  SqliteTaskStore store(root / "tasks.db");
  OpenStore(store);
  ASSERT_OK(store.Insert(MakeRecord("t1")));
  const auto res = store.Insert(MakeRecord("t1"));
  ASSERT(!res.ok);
  ASSERT_EQ(Load(store, "t1").names.size(), 3u);
}

TEST(claim_is_conditional) {
  TempRoot root;
  SqliteTaskStore store(root / "tasks.db");
  OpenStore(store);
  ASSERT_OK(store.Insert(MakeRecord("t1")));

  bool claimed = false;
  ASSERT_OK(store.ClaimQueued("t1", claimed));
  ASSERT(claimed);
  ASSERT_OK(store.ClaimQueued("t1", claimed));
  ASSERT(!claimed);
  ASSERT_OK(store.ClaimQueued("missing", claimed));
  ASSERT(!claimed);

  const auto t = Load(store, "t1");
  ASSERT(t.status == TaskStatus::Running);
  ASSERT(t.startedAt);
}

TEST(progress_and_completion) {
  TempRoot root;
  SqliteTaskStore store(root / "tasks.db");
  OpenStore(store);
  ASSERT_OK(store.Insert(MakeRecord("t1")));

  // Not running yet: ignored.
  ASSERT_OK(store.UpdateProgress("t1", 1, 4, std::string("a")));
  ASSERT_EQ(Load(store, "t1").processedUnits, 0u);

  bool ok = false;
  ASSERT_OK(store.ClaimQueued("t1", ok));
  ASSERT_OK(store.UpdateProgress("t1", 2, 4, std::string("a/x")));
  auto t = Load(store, "t1");
  ASSERT_EQ(t.processedUnits, 2u);
  ASSERT_EQ(t.totalUnits, 4u);
  ASSERT_EQ(t.currentItem.value_or(""), std::string("a/x"));

  bool finished = false;
  ASSERT_OK(store.FinishRunning("t1", TaskStatus::Completed, 4, std::nullopt, finished));
  ASSERT(finished);
  t = Load(store, "t1");
  ASSERT(t.status == TaskStatus::Completed);
  ASSERT_EQ(t.processedUnits, 4u);
  ASSERT_EQ(t.totalUnits, 4u);
  ASSERT(!t.currentItem);
  ASSERT(!t.error);
  ASSERT(t.finishedAt);

  // Terminal rows are never finished twice.
  ASSERT_OK(store.FinishRunning("t1", TaskStatus::Failed, std::nullopt, std::string("x"), finished));
  ASSERT(!finished);
  ASSERT(Load(store, "t1").status == TaskStatus::Completed);
}

TEST(failure_keeps_message) {
  TempRoot root;
  SqliteTaskStore store(root / "tasks.db");
  OpenStore(store);
  ASSERT_OK(store.Insert(MakeRecord("t1")));
  bool ok = false;
  ASSERT_OK(store.ClaimQueued("t1", ok));
  ASSERT_OK(store.FinishRunning("t1", TaskStatus::Failed, std::nullopt,
                                std::string("\"a\" does not exist"), ok));
  const auto t = Load(store, "t1");
  ASSERT(t.status == TaskStatus::Failed);
  ASSERT_EQ(t.error.value_or(""), std::string("\"a\" does not exist"));
}

TEST(cancel_queued_and_cancel_flag) {
  TempRoot root;
  SqliteTaskStore store(root / "tasks.db");
  OpenStore(store);
  ASSERT_OK(store.Insert(MakeRecord("q")));
  ASSERT_OK(store.Insert(MakeRecord("r")));

  bool cancel = false;
  ASSERT_OK(store.IsCancelRequested("missing", cancel));
  ASSERT(cancel);
  ASSERT_OK(store.IsCancelRequested("q", cancel));
  ASSERT(cancel);

  bool applied = false;
  ASSERT_OK(store.CancelQueued("q", applied));
  ASSERT(applied);
  const auto q = Load(store, "q");
  ASSERT(q.status == TaskStatus::Cancelled);
  ASSERT(q.cancelRequested);
  ASSERT(q.finishedAt);

  ASSERT_OK(store.ClaimQueued("r", applied));
  ASSERT_OK(store.CancelQueued("r", applied));
  ASSERT(!applied);
  ASSERT_OK(store.IsCancelRequested("r", cancel));
  ASSERT(!cancel);
  ASSERT_OK(store.RequestCancel("r", applied));
  ASSERT(applied);
  ASSERT_OK(store.IsCancelRequested("r", cancel));
  ASSERT(cancel);
  ASSERT(Load(store, "r").status == TaskStatus::Running);
}

TEST(reopen_marks_stale_tasks_interrupted) {
  TempRoot root;
  const auto db = root / "tasks.db";
  {
    SqliteTaskStore store(db);
    OpenStore(store);
    ASSERT_OK(store.Insert(MakeRecord("queued")));
    ASSERT_OK(store.Insert(MakeRecord("running", TaskStatus::Running)));
    ASSERT_OK(store.Insert(MakeRecord("done", TaskStatus::Completed)));
  }

  SqliteTaskStore store(db);
  OpenStore(store);
  int count = 0;
  ASSERT_OK(store.MarkStaleInterrupted("Process restarted before task completion", count));
  ASSERT_EQ(count, 2);

  for (const char* id : {"queued", "running"}) {
    const auto t = Load(store, id);
    ASSERT(t.status == TaskStatus::Interrupted);
    ASSERT_EQ(t.error.value_or(""), std::string("Process restarted before task completion"));
    ASSERT(t.finishedAt);
    ASSERT(!t.cancelRequested);
  }
  ASSERT(Load(store, "done").status == TaskStatus::Completed);
}

TEST(list_orders_and_delete_completed) {
  TempRoot root;
  SqliteTaskStore store(root / "tasks.db");
  OpenStore(store);
  ASSERT_OK(store.Insert(MakeRecord("old", TaskStatus::Completed, "2026-01-01T00:00:00.000Z")));
  ASSERT_OK(store.Insert(MakeRecord("mid", TaskStatus::Queued, "2026-01-02T00:00:00.000Z")));
  ASSERT_OK(store.Insert(MakeRecord("new", TaskStatus::Running, "2026-01-03T00:00:00.000Z")));
  ASSERT_OK(store.Insert(MakeRecord("tie", TaskStatus::Failed, "2026-01-03T00:00:00.000Z")));

  std::vector<TaskRecord> recent;
  ASSERT_OK(store.ListRecent(3, recent));
  ASSERT_EQ(recent.size(), 3u);
  ASSERT_EQ(recent[0].id, std::string("tie"));
  ASSERT_EQ(recent[1].id, std::string("new"));
  ASSERT_EQ(recent[2].id, std::string("mid"));

  std::vector<TaskRecord> active;
  ASSERT_OK(store.ListActive(active));
  ASSERT_EQ(active.size(), 2u);
  ASSERT_EQ(active[0].id, std::string("mid"));
  ASSERT_EQ(active[1].id, std::string("new"));

  int removed = 0;
  ASSERT_OK(store.DeleteCompleted(removed));
  ASSERT_EQ(removed, 1);
  std::optional<TaskRecord> gone;
  ASSERT_OK(store.Find("old", gone));
  ASSERT(!gone);
}

TEST(scheduler_runs_fifo_once) {
  std::mutex mu;
  std::vector<std::string> ran;
  TaskScheduler scheduler([&](const std::string& id) {
    std::lock_guard<std::mutex> lock(mu);
    ran.push_back(id);
  });
  scheduler.Pause();
  scheduler.Start();
  scheduler.Enqueue("a");
  scheduler.Enqueue("b");
  scheduler.Enqueue("a");
  scheduler.Enqueue("c");
  ASSERT_EQ(scheduler.QueuedCount(), 3u);
  ASSERT(scheduler.Remove("b"));
  ASSERT(!scheduler.Remove("b"));
  ASSERT(!scheduler.WaitIdle(50ms));

  scheduler.Resume();
  ASSERT(scheduler.WaitIdle(5s));
  std::lock_guard<std::mutex> lock(mu);
  ASSERT_EQ(ran, (std::vector<std::string>{"a", "c"}));
}

TEST(scheduler_survives_throwing_executor) {
  std::mutex mu;
  std::vector<std::string> ran;
  TaskScheduler scheduler([&](const std::string& id) {
    if (id == "boom") throw std::runtime_error("executor failure");
    std::lock_guard<std::mutex> lock(mu);
    ran.push_back(id);
  });
  scheduler.Start();
  scheduler.Enqueue("boom");
  scheduler.Enqueue("after");
  ASSERT(scheduler.WaitIdle(5s));
  std::lock_guard<std::mutex> lock(mu);
  ASSERT_EQ(ran, (std::vector<std::string>{"after"}));
}

TEST(scheduler_stop_flags_running_task) {
  std::atomic<bool> sawStop{false};
  std::atomic<bool> started{false};
  TaskScheduler* self = nullptr;
  TaskScheduler scheduler([&](const std::string&) {
    started = true;
    while (!self->Stopping()) std::this_thread::sleep_for(1ms);
    sawStop = true;
  });
  self = &scheduler;
  scheduler.Start();
  scheduler.Enqueue("long");
  while (!started) std::this_thread::sleep_for(1ms);
  scheduler.Stop();
  ASSERT(sawStop);
}

int main() {
  TestEnvironment env;
  if (!env.IsOk()) return 1;
  printf("Running task store and scheduler tests...\n");

  RUN_TEST(status_names_round_trip);
  RUN_TEST(insert_and_find_preserve_names);
  RUN_TEST(duplicate_insert_fails_cleanly);
  RUN_TEST(claim_is_conditional);
  RUN_TEST(progress_and_completion);
  RUN_TEST(failure_keeps_message);
  RUN_TEST(cancel_queued_and_cancel_flag);
  RUN_TEST(reopen_marks_stale_tasks_interrupted);
  RUN_TEST(list_orders_and_delete_completed);
  RUN_TEST(scheduler_runs_fifo_once);
  RUN_TEST(scheduler_survives_throwing_executor);
  RUN_TEST(scheduler_stop_flags_running_task);

  return Summarize();
}
