// shimbridge/lsp/one_shot.hpp - Single-assignment synchronized cell
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace shimbridge::lsp
{

/**
 * A value that is resolved at most once.
 *
 * Several producers may race to resolve the cell; the first one wins and
 * later attempts are ignored. Consumers block until a value is present.
 */
template <typename T>
class OneShot
{
public:
  /// Store `value` unless the cell is already resolved. Returns true if stored.
  bool resolve(T value)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (value_) {
        return false;
      }
      value_ = std::move(value);
    }
    cv_.notify_all();
    return true;
  }

  /// Block until resolved.
  [[nodiscard]] T wait()
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return value_.has_value(); });
    return *value_;
  }

  /// Block until resolved or `timeout` elapses.
  [[nodiscard]] std::optional<T> wait_for(std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return value_.has_value(); })) {
      return std::nullopt;
    }
    return value_;
  }

  [[nodiscard]] std::optional<T> peek() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<T> value_;
};

/**
 * Runs a callback on a background thread once a deadline passes, unless the
 * timer is destroyed first. Destruction cancels and joins.
 */
class DeadlineTimer
{
public:
  template <typename Fn>
  DeadlineTimer(std::chrono::milliseconds delay, Fn on_expire)
  : deadline_(std::chrono::steady_clock::now() + delay)
  {
    thread_ = std::thread([this, fn = std::move(on_expire)]() mutable {
      std::unique_lock<std::mutex> lock(mutex_);
      if (!cv_.wait_until(lock, deadline_, [this] { return cancelled_; })) {
        lock.unlock();
        fn();
      }
    });
  }

  DeadlineTimer(const DeadlineTimer &) = delete;
  DeadlineTimer & operator=(const DeadlineTimer &) = delete;

  ~DeadlineTimer()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

private:
  std::chrono::steady_clock::time_point deadline_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
  std::thread thread_;
};

}  // namespace shimbridge::lsp
