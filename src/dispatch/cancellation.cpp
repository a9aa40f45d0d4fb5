#include "teledrop/dispatch/cancellation.hpp"

#include <algorithm>

namespace teledrop::dispatch {

namespace {

constexpr std::chrono::milliseconds kPollSlice(50);

} // namespace

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true);
  }
  cv_.notify_all();
}

void CancellationToken::cancel_from_signal() noexcept { cancelled_.store(true); }

void CancellationToken::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_.store(false);
}

bool CancellationToken::is_cancelled() const noexcept { return cancelled_.load(); }

bool CancellationToken::wait_for(const std::chrono::milliseconds delay) const {
  using Clock = std::chrono::steady_clock;
  const auto start = Clock::now();
  // Saturates instead of overflowing the clock for very long delays.
  const auto headroom =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - start);
  const auto deadline = delay >= headroom
                            ? Clock::time_point::max()
                            : start + std::chrono::duration_cast<Clock::duration>(delay);
  std::unique_lock<std::mutex> lock(mutex_);
  while (!cancelled_.load()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    cv_.wait_for(lock, std::min(remaining + std::chrono::milliseconds(1), kPollSlice),
                 [this]() { return cancelled_.load(); });
  }
  return false;
}

bool SteadyWaiter::wait_for(const std::chrono::milliseconds delay,
                            const CancellationToken &token) {
  return token.wait_for(delay);
}

} // namespace teledrop::dispatch
