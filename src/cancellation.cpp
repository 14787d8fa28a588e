#include "cancellation.hpp"

#include <algorithm>

namespace hostlogin {

namespace {
constexpr std::chrono::milliseconds kPollSlice{100};
} // namespace

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
  if (!state_) {
    if (timeout.count() > 0) {
      std::mutex mutex;
      std::condition_variable cv;
      std::unique_lock<std::mutex> lock(mutex);
      cv.wait_for(lock, timeout, [] { return false; });
    }
    return false;
  }
  auto end = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lock(state_->mutex);
  while (!cancelled()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= end) {
      break;
    }
    auto slice = std::min<std::chrono::steady_clock::duration>(kPollSlice,
                                                               end - now);
    state_->cv.wait_for(lock, slice, [this] { return cancelled(); });
  }
  return cancelled();
}

void CancellationSource::cancel() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled.store(true, std::memory_order_release);
  }
  state_->cv.notify_all();
}

} // namespace hostlogin
