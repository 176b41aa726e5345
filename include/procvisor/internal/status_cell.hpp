#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace procvisor::internal {

/// @brief Slot written once by one thread and read after notification.
template <typename T>
class StatusCell {
 public:
  /// @brief Store the value. Only the first call has an effect.
  bool set(T value) {
    {
      std::lock_guard lock(mutex_);
      if (value_) {
        return false;
      }
      value_.emplace(std::move(value));
    }
    ready_.notify_all();
    return true;
  }

  /// @brief Wait up to timeout; empty if nothing has been written yet.
  std::optional<T> wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    ready_.wait_for(lock, timeout, [this] { return value_.has_value(); });
    return value_;
  }

  [[nodiscard]] bool has_value() const {
    std::lock_guard lock(mutex_);
    return value_.has_value();
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable ready_;
  std::optional<T> value_;
};

}  // namespace procvisor::internal
