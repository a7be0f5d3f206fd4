/*
  Executors — sequential loop and TBB task-arena worker pool.
*/
#include "riverconn/core/executor.hpp"

#include <stdexcept>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace riverconn::core {

namespace {
class SequentialExecutor final : public Executor {
public:
  int concurrency() const noexcept override { return 1; }

  void run(std::size_t n, const std::function<void(std::size_t)>& task) override {
    for (std::size_t i = 0; i < n; ++i) task(i);
  }
};

class TbbExecutor final : public Executor {
public:
  explicit TbbExecutor(int workers) : workers_(workers), arena_(workers) {}

  int concurrency() const noexcept override { return workers_; }

  void run(std::size_t n, const std::function<void(std::size_t)>& task) override {
    if (n == 0) return;
    // Grain size 1: scenarios are coarse and uneven, let TBB balance them.
    arena_.execute([&] {
      tbb::parallel_for(tbb::blocked_range<std::size_t>(0, n, 1),
          [&](const tbb::blocked_range<std::size_t>& r) {
            for (std::size_t i = r.begin(); i != r.end(); ++i) task(i);
          });
    });
  }

private:
  int workers_;
  tbb::task_arena arena_;
};
} // namespace

ExecutorPtr make_sequential_executor() {
  return std::make_shared<SequentialExecutor>();
}

ExecutorPtr make_tbb_executor(int workers) {
  if (workers < 1) {
    throw std::invalid_argument("make_tbb_executor: workers must be >= 1");
  }
  return std::make_shared<TbbExecutor>(workers);
}

} // namespace riverconn::core
