// ============================================================================
// task_supervisor.cpp — implementation for task_supervisor.hpp
// ============================================================================

#include "kdc/task_supervisor.hpp"

#include <chrono>
#include <exception>

#include <spdlog/spdlog.h>

namespace kdc {

static constexpr int SLICE_MS = 50;

TaskSupervisor::~TaskSupervisor() {
  stop();
}

void TaskSupervisor::spawn(const std::string& name, Body body) {
  auto alive = std::make_shared<std::atomic<bool>>(true);
  std::lock_guard<std::mutex> lk(mu_);
  restarts_[name];
  tasks_.push_back(Task{name, std::thread(&TaskSupervisor::run, this, name, std::move(body), alive), alive});
}

// ---------------------------------------------------------------------------
// run()
// -----
// Body in a loop: normal return ends the task, an exception restarts it after
// the delay. The delay itself is cancel-aware so stop() never waits it out.
// ---------------------------------------------------------------------------
void TaskSupervisor::run(const std::string& name, const Body& body,
                         const std::shared_ptr<std::atomic<bool>>& alive) {
  spdlog::debug("task {}: started", name);
  while (!cancel_.cancelled()) {
    try {
      body(cancel_);
      break;
    } catch (const std::exception& e) {
      std::size_t n;
      {
        std::lock_guard<std::mutex> lk(mu_);
        n = ++restarts_[name];
      }
      spdlog::error("task {}: failed ({}), restart #{} in {} ms", name, e.what(), n, restart_delay_ms_);
    }
    for (int waited = 0; waited < restart_delay_ms_ && !cancel_.cancelled(); waited += SLICE_MS)
      std::this_thread::sleep_for(std::chrono::milliseconds(SLICE_MS));
  }
  alive->store(false);
  spdlog::debug("task {}: finished", name);
}

void TaskSupervisor::stop() {
  cancel_.cancel();
  std::vector<Task> tasks;
  {
    std::lock_guard<std::mutex> lk(mu_);
    tasks.swap(tasks_);
  }
  for (auto& t : tasks) {
    if (t.thread.joinable()) t.thread.join();
  }
}

std::size_t TaskSupervisor::restarts(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = restarts_.find(name);
  return it == restarts_.end() ? 0 : it->second;
}

std::size_t TaskSupervisor::running() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (const auto& t : tasks_) n += t.alive->load() ? 1 : 0;
  return n;
}

} // namespace kdc
