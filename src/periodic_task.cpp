// -----------------------------------------------------------------------------
// periodic_task.cpp: steady_timer loops on one io_context worker.
// -----------------------------------------------------------------------------
#include "hopmesh/periodic_task.hpp"
#include "hopmesh/log.hpp"

#include <boost/asio/post.hpp>

#include <chrono>
#include <exception>

namespace hopmesh {

TaskScheduler::TaskScheduler()
: work_(boost::asio::make_work_guard(io_)),
  worker_([this] { io_.run(); }) {}

TaskScheduler::~TaskScheduler() {
  stop();
}

TaskScheduler::TaskId TaskScheduler::schedule_every(const std::string& name, uint64_t interval_ms, TaskFn fn) {
  if (!running_.load() || interval_ms == 0 || !fn) return INVALID_TASK;

  std::shared_ptr<Task> task;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const TaskId id = next_id_++;
    task = std::make_shared<Task>(io_, id, name, interval_ms, std::move(fn));
    tasks_.emplace(id, task);
  }
  // Timers are only touched on the worker thread.
  boost::asio::post(io_, [this, task] { arm(task); });
  HOPMESH_LOG_DEBUG("timer", "scheduled '" << name << "' every " << interval_ms << " ms");
  return task->id;
}

// -----------------------------------------------------------------------------
// arm
// PRE: on the worker thread.
// POLICY: re-arm after the body runs, so a slow body delays only itself.
// -----------------------------------------------------------------------------
void TaskScheduler::arm(const std::shared_ptr<Task>& task) {
  if (task->cancelled.load()) return;

  task->timer.expires_after(std::chrono::milliseconds(task->interval_ms));
  std::weak_ptr<Task> weak = task;
  task->timer.async_wait([this, weak](const boost::system::error_code& ec) {
    std::shared_ptr<Task> t = weak.lock();
    if (!t || ec == boost::asio::error::operation_aborted || t->cancelled.load()) return;
    if (ec) {
      HOPMESH_LOG_ERROR("timer", "'" << t->name << "' timer error: " << ec.message());
      return;
    }

    try {
      t->fn();
    } catch (const std::exception& e) {
      HOPMESH_LOG_ERROR("timer", "'" << t->name << "' threw: " << e.what());
    }
    ++t->runs;
    arm(t);
  });
}

bool TaskScheduler::cancel(TaskId id) {
  std::shared_ptr<Task> task;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return false;
    task = it->second;
    tasks_.erase(it);
  }
  if (task->cancelled.exchange(true)) return false;
  boost::asio::post(io_, [task] { task->timer.cancel(); });
  HOPMESH_LOG_DEBUG("timer", "cancelled '" << task->name << "'");
  return true;
}

void TaskScheduler::stop() {
  if (!running_.exchange(false)) return;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : tasks_) kv.second->cancelled.store(true);
  }
  work_.reset();
  io_.stop();
  if (worker_.joinable()) worker_.join();

  // Worker is gone: timers can be destroyed from this thread.
  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.clear();
}

size_t TaskScheduler::task_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

uint64_t TaskScheduler::runs(TaskId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(id);
  return it == tasks_.end() ? 0 : it->second->runs.load();
}

} // namespace hopmesh
