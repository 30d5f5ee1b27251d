#include "cancellation.hpp"

namespace entitlement::backoff {

CancellationToken::CancellationToken(SteadyClock::time_point deadline) : deadline_(deadline) {
}

void CancellationToken::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(mutex_);
  return cancelled_ || (deadline_ && SteadyClock::now() >= *deadline_);
}

bool CancellationToken::WaitFor(std::chrono::milliseconds delay) const {
  std::unique_lock lock(mutex_);

  const auto wake_at        = SteadyClock::now() + delay;
  const bool deadline_first = deadline_ && *deadline_ <= wake_at;

  cv_.wait_until(lock, deadline_first ? *deadline_ : wake_at, [this] { return cancelled_; });
  return !cancelled_ && !deadline_first;
}

} // namespace entitlement::backoff
