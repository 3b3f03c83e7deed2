#pragma once

// Taskflow core and algorithms
#include <taskflow/taskflow.hpp>                  // tf::Executor, tf::Taskflow, tf::Future
#include <taskflow/algorithm/for_each.hpp>        // tf::Taskflow::for_each, for_each_index

#include <cstddef>
#include <thread>
#include <type_traits>
#include <utility>

namespace tribe::jobs {

// Thin wrapper over a Taskflow executor used for independent fan-out scoring.
// Sequential passes (swap optimization) never go through here.
class JobSystem {
public:
  // Process-wide pool sized to the hardware.
  static JobSystem& Instance();

  explicit JobSystem(std::size_t workers = 0)
    : _executor(workers == 0 ? Concurrency() : workers) {}

  JobSystem(const JobSystem&) = delete;
  JobSystem& operator=(const JobSystem&) = delete;

  std::size_t workerCount() const noexcept { return _executor.num_workers(); }

  // Index-based parallel for over [first, last) with step. Non-blocking.
  template <typename Index, typename F>
  std::enable_if_t<std::is_integral_v<Index>, tf::Future<void>>
  ParallelForIndexAsync(Index first, Index last, Index step, F&& fn) {
    tf::Taskflow taskflow;
    taskflow.for_each_index(first, last, step, std::forward<F>(fn));
    return _executor.run(std::move(taskflow));
  }

  // Blocking variant for external threads. Do NOT call from inside a task
  // running on this executor.
  template <typename Index, typename F>
  std::enable_if_t<std::is_integral_v<Index>, void>
  ParallelForIndex(Index first, Index last, Index step, F&& fn) {
    if (first >= last)
      return;
    ParallelForIndexAsync(first, last, step, std::forward<F>(fn)).wait();
  }

  static unsigned Concurrency() noexcept {
    const unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1u : n;
  }

private:
  tf::Executor _executor;
};

} // namespace tribe::jobs
