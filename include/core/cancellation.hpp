#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <utility>

namespace wx_agent::core {

// A caller's stop signal: an optional shared flag raised by the caller and an
// optional deadline. A default-constructed Cancellation never fires.
class Cancellation {
 public:
  using Clock = std::chrono::steady_clock;

  Cancellation() = default;
  Cancellation(std::shared_ptr<std::atomic_bool> flag, std::optional<Clock::time_point> deadline)
      : flag_(std::move(flag)), deadline_(deadline) {}

  static Cancellation after(const std::chrono::milliseconds timeout) {
    return Cancellation(nullptr, deadline_after(timeout));
  }

  // now() + timeout, saturating at time_point::max() instead of overflowing.
  static Clock::time_point deadline_after(const std::chrono::milliseconds timeout) {
    const auto now = Clock::now();
    if (timeout >= std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now)) {
      return Clock::time_point::max();
    }
    return now + timeout;
  }

  [[nodiscard]] bool requested() const {
    if (flag_ != nullptr && flag_->load()) {
      return true;
    }
    return deadline_.has_value() && Clock::now() >= *deadline_;
  }

  // Time left before the deadline, or nullopt when there is none.
  [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const {
    if (!deadline_.has_value()) {
      return std::nullopt;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
  }

  // Caps `budget` by the time left before the deadline.
  [[nodiscard]] std::chrono::milliseconds bound(const std::chrono::milliseconds budget) const {
    const auto left = remaining();
    return left.has_value() ? std::min(budget, *left) : budget;
  }

  [[nodiscard]] Cancellation with_deadline(const Clock::time_point deadline) const {
    const auto effective = deadline_.has_value() ? std::min(*deadline_, deadline) : deadline;
    return Cancellation(flag_, effective);
  }

 private:
  std::shared_ptr<std::atomic_bool> flag_{};
  std::optional<Clock::time_point> deadline_{};
};

}  // namespace wx_agent::core
