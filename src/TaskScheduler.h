#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// FIFO of task ids drained by one worker thread. Each task runs to completion
// before the next one is popped.
class TaskScheduler final {
public:
  using Executor = std::function<void(const std::string& taskId)>;

  explicit TaskScheduler(Executor executor);
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;

  void Start();
  // Lets the running task finish (it should poll Stopping()), drops the queue
  // and joins the worker.
  void Stop();
  bool Stopping() const { return stopping_.load(); }

  // No-op when the id is already queued.
  void Enqueue(const std::string& taskId);
  // True when the id was waiting and has been removed.
  bool Remove(const std::string& taskId);

  // Holds the worker before its next claim; the running task is unaffected.
  void Pause();
  void Resume();

  // False on timeout.
  bool WaitIdle(std::chrono::milliseconds timeout);

  std::size_t QueuedCount() const;

private:
  void WorkerLoop();

  Executor executor_;
  mutable std::mutex mu_{};
  std::condition_variable cv_{};
  std::condition_variable idleCv_{};
  std::deque<std::string> queue_{};
  std::thread worker_{};
  bool running_{false};
  bool paused_{false};
  bool started_{false};
  std::atomic<bool> stopping_{false};
};
