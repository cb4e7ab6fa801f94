#include "TaskScheduler.h"

#include <wx/log.h>

#include <algorithm>
#include <exception>

TaskScheduler::TaskScheduler(Executor executor) : executor_(std::move(executor)) {}

TaskScheduler::~TaskScheduler() { Stop(); }

void TaskScheduler::Start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (started_) return;
  started_ = true;
  stopping_.store(false);

  // Messages logged on the worker go to the target active when the scheduler
  // started instead of being buffered for the main thread.
  wxLog* target = wxLog::GetActiveTarget();
  worker_ = std::thread([this, target]() {
    wxLog::SetThreadActiveTarget(target);
    WorkerLoop();
    wxLog::SetThreadActiveTarget(nullptr);
  });
}

void TaskScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!started_) return;
    stopping_.store(true);
    queue_.clear();
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();

  std::lock_guard<std::mutex> lock(mu_);
  started_ = false;
  idleCv_.notify_all();
}

void TaskScheduler::Enqueue(const std::string& taskId) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (std::find(queue_.begin(), queue_.end(), taskId) != queue_.end()) return;
    queue_.push_back(taskId);
  }
  cv_.notify_one();
}

bool TaskScheduler::Remove(const std::string& taskId) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = std::find(queue_.begin(), queue_.end(), taskId);
  if (it == queue_.end()) return false;
  queue_.erase(it);
  if (queue_.empty() && !running_) idleCv_.notify_all();
  return true;
}

void TaskScheduler::Pause() {
  std::lock_guard<std::mutex> lock(mu_);
  paused_ = true;
}

void TaskScheduler::Resume() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    paused_ = false;
  }
  cv_.notify_all();
}

bool TaskScheduler::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  return idleCv_.wait_for(lock, timeout, [this]() { return queue_.empty() && !running_; });
}

std::size_t TaskScheduler::QueuedCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

void TaskScheduler::WorkerLoop() {
  for (;;) {
    std::string taskId;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this]() { return stopping_.load() || (!paused_ && !queue_.empty()); });
      if (stopping_.load()) return;
      taskId = queue_.front();
      queue_.pop_front();
      running_ = true;
    }

    try {
      executor_(taskId);
    } catch (const std::exception& e) {
      wxLogError("Task %s aborted: %s", taskId, wxString::FromUTF8(e.what()));
    }

    {
      std::lock_guard<std::mutex> lock(mu_);
      running_ = false;
      if (queue_.empty()) idleCv_.notify_all();
    }
  }
}
