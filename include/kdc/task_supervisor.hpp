#pragma once
/**
 * @file task_supervisor.hpp
 * @brief Long-lived background tasks that cannot take each other down.
 *
 * @details
 * Each discovery producer and each maintenance loop runs as its own thread
 * under the supervisor. A task body that throws `std::exception` is logged at
 * error level and restarted after `restart_delay_ms`; the other tasks never
 * notice. A body that returns normally is finished and is not restarted.
 *
 * `stop()` cancels every task's token and joins them. Bodies are expected to
 * poll the token at least every few hundred milliseconds.
 */

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "kdc/transport/transport_base.hpp"

namespace kdc {

class TaskSupervisor {
public:
  using Body = std::function<void(const transport::CancelToken&)>;

  explicit TaskSupervisor(int restart_delay_ms = 1000) : restart_delay_ms_(restart_delay_ms) {}
  ~TaskSupervisor();

  TaskSupervisor(const TaskSupervisor&) = delete;
  TaskSupervisor& operator=(const TaskSupervisor&) = delete;

  /// Start @p body on its own thread under @p name.
  void spawn(const std::string& name, Body body);

  /// Cancel and join every task. Idempotent.
  void stop();

  /// How many times @p name has been restarted after a failure.
  std::size_t restarts(const std::string& name) const;

  std::size_t running() const;

private:
  struct Task {
    std::string                        name;
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> alive;
  };

  void run(const std::string& name, const Body& body, const std::shared_ptr<std::atomic<bool>>& alive);

  int                                   restart_delay_ms_;
  transport::CancelToken                cancel_;
  mutable std::mutex                    mu_;
  std::vector<Task>                     tasks_;
  std::map<std::string, std::size_t>    restarts_;
};

} // namespace kdc
