#include <chronicle/execution/job_executor.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace chronicle::execution {

job_executor::job_executor(std::size_t threads) {
  if (threads == 0) {
    threads = 1;
  }
  workers_.reserve(threads);
  for (auto i = std::size_t{0}; i < threads; ++i) {
    workers_.emplace_back([this] { run(); });
  }
  spdlog::debug("Job executor started with {} thread(s)", threads);
}

job_executor::~job_executor() {
  shutdown();
}

bool job_executor::submit(std::function<void()> job) {
  {
    auto lock = std::scoped_lock{mutex_};
    if (stopping_) {
      return false;
    }
    jobs_.push(std::move(job));
  }
  work_available_.notify_one();
  return true;
}

void job_executor::wait_idle() {
  auto lock = std::unique_lock{mutex_};
  idle_.wait(lock, [this] { return jobs_.empty() && active_ == 0; });
}

void job_executor::shutdown() {
  wait_idle();
  {
    auto lock = std::scoped_lock{mutex_};
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  work_available_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

std::size_t job_executor::pending() const {
  auto lock = std::scoped_lock{mutex_};
  return jobs_.size() + active_;
}

void job_executor::run() {
  while (true) {
    auto job = std::function<void()>{};
    {
      auto lock = std::unique_lock{mutex_};
      work_available_.wait(lock,
                           [this] { return stopping_ || !jobs_.empty(); });
      if (stopping_ && jobs_.empty()) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop();
      ++active_;
    }
    try {
      job();
    } catch (const std::exception& ex) {
      spdlog::error("Dispatch job failed: {}", ex.what());
    } catch (...) {
      spdlog::error("Dispatch job failed with a non-standard exception");
    }
    {
      auto lock = std::scoped_lock{mutex_};
      --active_;
    }
    idle_.notify_all();
  }
}

}  // namespace chronicle::execution
