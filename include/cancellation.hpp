/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for long-running authorization handshakes.
 *
 * A CancellationSource owns the shared state; CancellationToken copies observe
 * it. Waiting on a token returns early when cancellation is requested, which
 * lets polling loops abort promptly.
 */
#ifndef HOSTLOGIN_CANCELLATION_HPP
#define HOSTLOGIN_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace hostlogin {

namespace detail {
struct CancellationState {
  std::atomic<bool> cancelled{false};
  std::mutex mutex;
  std::condition_variable cv;
};
} // namespace detail

/// Read-only view of a cancellation request.
class CancellationToken {
public:
  /// Token that is never cancelled.
  CancellationToken() = default;

  /// Whether cancellation has been requested.
  bool cancelled() const {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  /**
   * Block for up to @p timeout or until cancellation is requested.
   *
   * Cancellation requested from a signal handler is noticed within one
   * polling slice (100 ms).
   *
   * @return `true` if the token is cancelled when the wait ends.
   */
  bool wait_for(std::chrono::milliseconds timeout) const;

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

/// Owner of a cancellation request.
class CancellationSource {
public:
  CancellationSource()
      : state_(std::make_shared<detail::CancellationState>()) {}

  /// Request cancellation and wake waiting threads.
  void cancel();

  /**
   * Request cancellation without locking.
   *
   * Safe to call from a signal handler; waiters observe the request at their
   * next polling slice.
   */
  void cancel_from_signal() noexcept {
    state_->cancelled.store(true, std::memory_order_release);
  }

  bool cancelled() const {
    return state_->cancelled.load(std::memory_order_acquire);
  }

  CancellationToken token() const { return CancellationToken(state_); }

private:
  std::shared_ptr<detail::CancellationState> state_;
};

/// Point in time after which an operation gives up.
class Deadline {
public:
  using clock = std::chrono::steady_clock;

  explicit Deadline(std::chrono::milliseconds budget)
      : at_(clock::now() + budget), budget_(budget) {}

  bool expired() const { return clock::now() >= at_; }

  std::chrono::milliseconds remaining() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        at_ - clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
  }

  std::chrono::milliseconds budget() const { return budget_; }

private:
  clock::time_point at_;
  std::chrono::milliseconds budget_;
};

} // namespace hostlogin

#endif // HOSTLOGIN_CANCELLATION_HPP
