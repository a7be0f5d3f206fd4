/*
  Executor interface — "map over independent units of work".

  The prioritization engine hands every scenario to an Executor as an index
  into a pre-sized result table, so results land in input order whatever the
  execution order. Two implementations are provided: a sequential loop and a
  fixed-size worker pool backed by a TBB task arena.
*/
#pragma once

#include <cstddef>
#include <functional>
#include <memory>

namespace riverconn::core {

class Executor {
public:
  virtual ~Executor() noexcept = default;

  // Maximum number of tasks running at the same time.
  [[nodiscard]] virtual int concurrency() const noexcept = 0;

  // Invoke task(i) once for every i in [0, n) and return when all have
  // completed. An exception thrown by a task is rethrown to the caller
  // after in-flight tasks finish.
  virtual void run(std::size_t n, const std::function<void(std::size_t)>& task) = 0;
};

using ExecutorPtr = std::shared_ptr<Executor>;

[[nodiscard]] ExecutorPtr make_sequential_executor();

// Worker pool limited to `workers` threads; throws std::invalid_argument if workers < 1.
[[nodiscard]] ExecutorPtr make_tbb_executor(int workers);

} // namespace riverconn::core
