/**
 * @file periodic_task.hpp
 * @brief Repeating background tasks on a Boost.Asio io_context.
 *
 * @details
 * The core needs three independent maintenance loops: dedup cache sweep,
 * stale-peer eviction and connect-timeout enforcement. Each is a
 * `steady_timer` re-armed after every run, all sharing one worker thread.
 *
 * - Tasks have no ordering relation to each other.
 * - cancel() stops one task; the others keep their schedule.
 * - A task body that throws a std::exception is logged and re-armed.
 * - stop() cancels everything and joins the worker. It must not be called
 *   from inside a task body.
 */
#ifndef HOPMESH_PERIODIC_TASK_HPP
#define HOPMESH_PERIODIC_TASK_HPP

#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace hopmesh {

class TaskScheduler {
public:
  using TaskId = uint64_t;
  using TaskFn = std::function<void()>;

  static constexpr TaskId INVALID_TASK = 0;

  /// Starts the worker thread.
  TaskScheduler();
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;

  /**
   * @brief Run `fn` every `interval_ms`, first run one interval from now.
   * @return Task id, or INVALID_TASK after stop() or for a zero interval.
   */
  TaskId schedule_every(const std::string& name, uint64_t interval_ms, TaskFn fn);

  /// @return false if the id is unknown or already cancelled.
  bool cancel(TaskId id);

  void stop();

  bool   running() const { return running_.load(); }
  size_t task_count() const;

  /// Completed runs of a task (0 for unknown ids).
  uint64_t runs(TaskId id) const;

private:
  struct Task {
    TaskId                    id;
    std::string               name;
    uint64_t                  interval_ms;
    TaskFn                    fn;
    boost::asio::steady_timer timer;
    std::atomic<bool>         cancelled{false};
    std::atomic<uint64_t>     runs{0};

    Task(boost::asio::io_context& io, TaskId id_, std::string name_, uint64_t interval, TaskFn fn_)
    : id(id_), name(std::move(name_)), interval_ms(interval), fn(std::move(fn_)), timer(io) {}
  };

  void arm(const std::shared_ptr<Task>& task);

  boost::asio::io_context                                                   io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>  work_;
  std::atomic<bool>                                                         running_{true};

  mutable std::mutex                       mutex_;
  std::map<TaskId, std::shared_ptr<Task>>  tasks_;
  TaskId                                   next_id_{1};

  std::thread                              worker_;   // last: starts running in the constructor
};

} // namespace hopmesh

#endif // HOPMESH_PERIODIC_TASK_HPP
