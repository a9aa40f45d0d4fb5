#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace teledrop::dispatch {

class CancellationToken {
public:
  void cancel();
  // Only touches a lock-free atomic, so it may be called from a signal handler.
  // Waiters notice within one poll slice.
  void cancel_from_signal() noexcept;
  void reset();

  [[nodiscard]] bool is_cancelled() const noexcept;

  /// Returns true when the full delay elapsed, false when cancelled first.
  [[nodiscard]] bool wait_for(std::chrono::milliseconds delay) const;

private:
  static_assert(std::atomic<bool>::is_always_lock_free);

  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

/// Every suspension of a run goes through a Waiter.
class Waiter {
public:
  virtual ~Waiter() = default;

  /// Returns false if the wait was interrupted by cancellation.
  [[nodiscard]] virtual bool wait_for(std::chrono::milliseconds delay,
                                      const CancellationToken &token) = 0;
};

class SteadyWaiter final : public Waiter {
public:
  [[nodiscard]] bool wait_for(std::chrono::milliseconds delay,
                              const CancellationToken &token) override;
};

} // namespace teledrop::dispatch
