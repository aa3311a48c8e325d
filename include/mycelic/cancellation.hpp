#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace mycelic {

// Copies share one flag, so a caller can keep a copy and cancel work running
// on another thread. A default token never stops anything.
class CancellationToken {
 public:
  using Clock = std::chrono::steady_clock;

  CancellationToken() = default;

  static CancellationToken WithDeadline(Clock::time_point deadline) {
    CancellationToken token{};
    token.deadline_ = deadline;
    return token;
  }
  static CancellationToken WithTimeout(Clock::duration timeout) { return WithDeadline(Clock::now() + timeout); }

  void Cancel() { flag_->store(true, std::memory_order_relaxed); }

  [[nodiscard]] bool stop_requested() const {
    if (flag_->load(std::memory_order_relaxed)) {
      return true;
    }
    return deadline_.has_value() && Clock::now() >= *deadline_;
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_ = std::make_shared<std::atomic<bool>>(false);
  std::optional<Clock::time_point> deadline_{};
};

}  // namespace mycelic
