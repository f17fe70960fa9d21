#include "../include/stoptoken.hpp"

#include <algorithm>

void StopToken::requestStop() {
  {
    std::lock_guard lock(mutex_);
    stopRequested_ = true;
  }
  cv_.notify_all();
}

bool StopToken::stopRequested() const {
  std::lock_guard lock(mutex_);
  return stopRequested_;
}

void StopToken::reset() {
  std::lock_guard lock(mutex_);
  stopRequested_ = false;
}

void StopToken::notify() {
  {
    std::lock_guard lock(mutex_);
    ++notifications_;
  }
  cv_.notify_all();
}

bool StopToken::waitFor(std::chrono::milliseconds timeout,
                        const std::function<bool()> &wakeIf,
                        std::chrono::milliseconds poll) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock lock(mutex_);
  const unsigned long seen = notifications_;

  while (true) {
    if (stopRequested_ || notifications_ != seen) return true;

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;

    auto slice = deadline - now;
    if (wakeIf) slice = std::min<std::chrono::steady_clock::duration>(slice, poll);

    cv_.wait_for(lock, slice,
                 [&] { return stopRequested_ || notifications_ != seen; });

    if (wakeIf && !stopRequested_ && notifications_ == seen) {
      // predicate может захватывать другие блокировки
      lock.unlock();
      const bool wake = wakeIf();
      lock.lock();
      if (wake) return true;
    }
  }
}
