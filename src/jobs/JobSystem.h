#pragma once

// Taskflow core and algorithms
#include <taskflow/taskflow.hpp>                  // tf::Executor, tf::Taskflow, tf::Future
#include <taskflow/algorithm/for_each.hpp>        // tf::Taskflow::for_each_index

// STL
#include <cstddef>
#include <type_traits>
#include <utility>

namespace islandgen::jobs {

// Owns a Taskflow executor and exposes the blocking/non-blocking parallel loops the
// automaton stepper needs. One instance per pipeline; not a process-wide singleton.
class JobSystem {
public:
  // `workers` threads; 0 is treated as 1.
  explicit JobSystem(unsigned workers);
  ~JobSystem();

  JobSystem(const JobSystem&) = delete;
  JobSystem& operator=(const JobSystem&) = delete;

  [[nodiscard]] unsigned workers() const noexcept { return _workers; }

  // Index-based parallel for_each_index over [first, last) with step.
  // Non-blocking: returns tf::Future<void> from executor.run(...)
  template <typename Index, typename F>
  std::enable_if_t<std::is_integral_v<Index>, tf::Future<void>>
  ParallelForIndexAsync(Index first, Index last, Index step, F&& fn) {
    tf::Taskflow taskflow;
    taskflow.for_each_index(first, last, step, std::forward<F>(fn));
    return _executor.run(std::move(taskflow));
  }

  // Blocking variant for external threads. Do NOT call from inside a task running
  // on this executor.
  template <typename Index, typename F>
  std::enable_if_t<std::is_integral_v<Index>, void>
  ParallelForIndex(Index first, Index last, Index step, F&& fn) {
    ParallelForIndexAsync(first, last, step, std::forward<F>(fn)).wait();
  }

private:
  unsigned     _workers;
  tf::Executor _executor;
};

} // namespace islandgen::jobs
