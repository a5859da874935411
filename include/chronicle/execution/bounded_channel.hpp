#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace chronicle::execution {

/// Fixed-capacity queue between one producer and one consumer. Either side
/// may close it: push() then returns false so a producer can stop work, and
/// pop() drains what is buffered before returning std::nullopt.
template <typename T>
class bounded_channel final {
 public:
  explicit bounded_channel(std::size_t capacity)
      : capacity_{capacity == 0 ? 1 : capacity} {}

  bounded_channel(const bounded_channel&) = delete;
  bounded_channel& operator=(const bounded_channel&) = delete;

  /// Blocks while the channel is full.
  bool push(T value) {
    auto lock = std::unique_lock{mutex_};
    not_full_.wait(lock,
                   [this] { return closed_ || buffer_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    buffer_.push_back(std::move(value));
    not_empty_.notify_one();
    return true;
  }

  /// Blocks until a value is available or the channel is closed and empty.
  std::optional<T> pop() {
    auto lock = std::unique_lock{mutex_};
    not_empty_.wait(lock, [this] { return closed_ || !buffer_.empty(); });
    if (buffer_.empty()) {
      return std::nullopt;
    }
    auto value = std::move(buffer_.front());
    buffer_.pop_front();
    not_full_.notify_one();
    return value;
  }

  void close() {
    {
      auto lock = std::scoped_lock{mutex_};
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  bool closed() const {
    auto lock = std::scoped_lock{mutex_};
    return closed_;
  }

  std::size_t size() const {
    auto lock = std::scoped_lock{mutex_};
    return buffer_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T> buffer_;
  std::size_t capacity_;
  bool closed_{};
};

}  // namespace chronicle::execution
