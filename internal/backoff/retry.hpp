#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include "backoff_policy.hpp"
#include "cancellation.hpp"

namespace entitlement::backoff {

/*
  RetryWithBackoff.

      Running ──ok──────────────► Succeeded
      Running ──error──► BackoffWait ──delay elapsed──► Running
      Running | BackoffWait ──limits hit──► Exhausted   (RetryExhausted, wraps last error)
      BackoffWait ──token fired──► Cancelled            (Cancelled, wraps last error)

  Runs on the calling thread; waits are timed waits on the cancellation
  token, not polling.
*/
enum class RetryPhase {
  kRunning,
  kBackoffWait,
  kSucceeded,
  kExhausted,
  kCancelled,
};

const char* ToString(RetryPhase phase);

// Time source and suspension point of the executor. Tests substitute a
// virtual clock.
class Waiter {
 public:
  virtual ~Waiter() = default;

  virtual std::chrono::steady_clock::time_point Now() const = 0;

  // Returns false if the token fired before the delay elapsed.
  virtual bool WaitFor(std::chrono::milliseconds delay, const CancellationToken& token) = 0;
};

class SteadyWaiter final : public Waiter {
 public:
  std::chrono::steady_clock::time_point Now() const override;
  bool WaitFor(std::chrono::milliseconds delay, const CancellationToken& token) override;
};

using Operation = std::function<arrow::Status()>;

// Called after each failed attempt that will be retried.
using Notify = std::function<void(const arrow::Status& error, std::chrono::milliseconds next_delay)>;

struct RetryOptions {
  Notify notify;

  // Returns false for permanent failures, which end the loop immediately.
  // Empty: every failure is retried.
  std::function<bool(const arrow::Status&)> retryable;

  const CancellationToken* cancel{nullptr};
  Waiter*                  waiter{nullptr};

  // Source of jitter samples in [0, 1]. Empty: thread-local PRNG.
  std::function<double()> random_unit;
};

arrow::Status Retry(const Operation& operation, const BackoffPolicy& policy, const RetryOptions& options = {});

inline arrow::Status RetryNotify(const Operation& operation, const BackoffPolicy& policy, Notify notify) {
  RetryOptions options;
  options.notify = std::move(notify);
  return Retry(operation, policy, options);
}

// Retries an operation that produces a value; returns the first success.
template <typename T>
arrow::Result<T> RetryResult(const std::function<arrow::Result<T>()>& operation, const BackoffPolicy& policy,
                             const RetryOptions& options = {}) {
  std::optional<T> value;
  auto             status = Retry(
      [&]() -> arrow::Status {
        ARROW_ASSIGN_OR_RAISE(auto result, operation());
        value = std::move(result);
        return arrow::Status::OK();
      },
      policy, options);
  if (!status.ok()) {
    return status;
  }
  return std::move(*value);
}

} // namespace entitlement::backoff
