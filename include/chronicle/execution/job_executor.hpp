#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace chronicle::execution {

/// Fixed-size worker pool for dispatch jobs. Jobs may submit further jobs;
/// wait_idle() returns only once the queue is drained and nothing runs.
class job_executor final {
 public:
  explicit job_executor(std::size_t threads);
  ~job_executor();

  job_executor(const job_executor&) = delete;
  job_executor& operator=(const job_executor&) = delete;

  /// Returns false once shutdown has begun.
  bool submit(std::function<void()> job);

  void wait_idle();

  /// Drain outstanding jobs, then join the workers.
  void shutdown();

  std::size_t pending() const;

 private:
  void run();

  mutable std::mutex mutex_;
  std::condition_variable work_available_;
  std::condition_variable idle_;
  std::queue<std::function<void()>> jobs_;
  std::size_t active_{};
  bool stopping_{};
  std::vector<std::thread> workers_;
};

}  // namespace chronicle::execution
