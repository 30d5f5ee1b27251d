#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace entitlement::backoff {

/*
  External stop signal for a retry loop: explicit Cancel() and/or a
  steady-clock deadline. Shared by reference between the canceller and
  the retrying thread.
*/
class CancellationToken {
 public:
  using SteadyClock = std::chrono::steady_clock;

  CancellationToken() = default;
  explicit CancellationToken(SteadyClock::time_point deadline);

  CancellationToken(const CancellationToken&)            = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();

  // True after Cancel() or once the deadline has passed.
  bool IsCancelled() const;

  std::optional<SteadyClock::time_point> deadline() const { return deadline_; }

  // Blocks for `delay` unless cancelled first (or the deadline falls inside
  // the wait). Returns true only if the whole delay elapsed uncancelled.
  bool WaitFor(std::chrono::milliseconds delay) const;

 private:
  mutable std::mutex                     mutex_;
  mutable std::condition_variable        cv_;
  bool                                   cancelled_{false};
  std::optional<SteadyClock::time_point> deadline_;
};

} // namespace entitlement::backoff
