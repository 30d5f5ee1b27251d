#include "retry.hpp"

#include <random>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/status.hpp"

namespace entitlement::backoff {

namespace {

double RandomUnit() {
  thread_local std::mt19937_64                        generator(std::random_device{}());
  thread_local std::uniform_real_distribution<double> distribution(0.0, 1.0);
  return distribution(generator);
}

arrow::Status Exhausted(std::uint32_t attempts, const arrow::Status& last) {
  return util::MakeError(util::ErrorKind::kRetryExhausted, last.code(),
                         "retry exhausted after " + std::to_string(attempts) + " attempt(s): " + last.message(), last);
}

arrow::Status Cancelled(std::uint32_t attempts, const arrow::Status& last) {
  std::string message = "retry cancelled after " + std::to_string(attempts) + " attempt(s)";
  if (!last.ok()) {
    message += ": " + last.message();
  }
  return util::MakeError(util::ErrorKind::kCancelled, arrow::StatusCode::Cancelled, message, last);
}

void LogPhase(RetryPhase phase, std::uint32_t attempts) {
  ENTITLEMENT_LOG_DEBUG("Retry phase", {entitlement::observability::StringField("phase", ToString(phase)),
                                        entitlement::observability::IntField("attempts", attempts)});
}

} // namespace

const char* ToString(RetryPhase phase) {
  switch (phase) {
    case RetryPhase::kRunning:
      return "running";
    case RetryPhase::kBackoffWait:
      return "backoff_wait";
    case RetryPhase::kSucceeded:
      return "succeeded";
    case RetryPhase::kExhausted:
      return "exhausted";
    case RetryPhase::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::chrono::steady_clock::time_point SteadyWaiter::Now() const {
  return std::chrono::steady_clock::now();
}

bool SteadyWaiter::WaitFor(std::chrono::milliseconds delay, const CancellationToken& token) {
  return token.WaitFor(delay);
}

arrow::Status Retry(const Operation& operation, const BackoffPolicy& policy, const RetryOptions& options) {
  policy.Validate();

  SteadyWaiter            steady_waiter;
  const CancellationToken never_cancelled;

  Waiter&                  waiter = options.waiter ? *options.waiter : steady_waiter;
  const CancellationToken& cancel = options.cancel ? *options.cancel : never_cancelled;

  const auto    started_at = waiter.Now();
  std::uint32_t attempts   = 0;
  arrow::Status last_error;

  while (true) {
    if (cancel.IsCancelled()) {
      LogPhase(RetryPhase::kCancelled, attempts);
      return Cancelled(attempts, last_error);
    }

    ++attempts;
    auto status = operation();
    if (status.ok()) {
      LogPhase(RetryPhase::kSucceeded, attempts);
      return status;
    }
    last_error = std::move(status);

    if (options.retryable && !options.retryable(last_error)) {
      return last_error;
    }

    if (policy.max_attempts && attempts >= *policy.max_attempts) {
      LogPhase(RetryPhase::kExhausted, attempts);
      return Exhausted(attempts, last_error);
    }

    const auto delay   = ComputeDelay(policy, attempts, options.random_unit ? options.random_unit() : RandomUnit());
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(waiter.Now() - started_at);
    if (policy.max_elapsed_time && elapsed + delay > *policy.max_elapsed_time) {
      LogPhase(RetryPhase::kExhausted, attempts);
      return Exhausted(attempts, last_error);
    }

    if (options.notify) {
      options.notify(last_error, delay);
    }

    LogPhase(RetryPhase::kBackoffWait, attempts);
    if (!waiter.WaitFor(delay, cancel)) {
      LogPhase(RetryPhase::kCancelled, attempts);
      return Cancelled(attempts, last_error);
    }
  }
}

} // namespace entitlement::backoff
