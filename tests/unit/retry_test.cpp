#include "internal/backoff/retry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/status.hpp"

namespace {

using entitlement::backoff::BackoffPolicy;
using entitlement::backoff::CancellationToken;
using entitlement::backoff::Retry;
using entitlement::backoff::RetryOptions;
using entitlement::backoff::Waiter;
using entitlement::util::ErrorKind;
using std::chrono::milliseconds;

// Virtual clock: waits complete instantly and advance time by the delay.
class FakeWaiter final : public Waiter {
 public:
  std::chrono::steady_clock::time_point Now() const override { return now_; }

  bool WaitFor(milliseconds delay, const CancellationToken& token) override {
    delays.push_back(delay);
    now_ += delay;
    if (cancel_after && delays.size() >= *cancel_after) {
      return false;
    }
    return !token.IsCancelled();
  }

  std::vector<milliseconds>  delays;
  std::optional<std::size_t> cancel_after;

 private:
  std::chrono::steady_clock::time_point now_{};
};

BackoffPolicy Deterministic() {
  auto policy                 = BackoffPolicy::Testing();
  policy.randomization_factor = 0.0;
  policy.multiplier           = 2.0;
  return policy;
}

RetryOptions WithWaiter(FakeWaiter& waiter) {
  RetryOptions options;
  options.waiter = &waiter;
  return options;
}

void TestSucceedsAfterTransientFailures() {
  FakeWaiter waiter;
  int        calls = 0;

  const auto status = Retry(
      [&] {
        ++calls;
        return calls < 4 ? arrow::Status::IOError("unavailable") : arrow::Status::OK();
      },
      Deterministic(), WithWaiter(waiter));

  assert(status.ok());
  assert(calls == 4);
  assert((waiter.delays == std::vector<milliseconds>{milliseconds(100), milliseconds(200), milliseconds(400)}));
}

void TestImmediateSuccessNeverWaits() {
  FakeWaiter waiter;
  const auto status = Retry([] { return arrow::Status::OK(); }, Deterministic(), WithWaiter(waiter));
  assert(status.ok());
  assert(waiter.delays.empty());
}

void TestExhaustedByAttempts() {
  FakeWaiter waiter;
  auto       policy = Deterministic();
  policy.max_attempts = 3;

  int        calls  = 0;
  const auto status = Retry(
      [&] {
        ++calls;
        return arrow::Status::IOError("attempt ", calls);
      },
      policy, WithWaiter(waiter));

  assert(!status.ok());
  assert(calls == 3);
  assert(waiter.delays.size() == 2);
  assert(entitlement::util::KindOf(status) == ErrorKind::kRetryExhausted);
  assert(status.IsIOError());

  const auto cause = entitlement::util::CauseOf(status);
  assert(cause.IsIOError());
  assert(cause.message() == "attempt 3");
}

void TestExhaustedByElapsedTime() {
  FakeWaiter waiter;
  int        calls = 0;

  // Testing(): 60 s budget, 5 s cap.
  const auto status = Retry(
      [&] {
        ++calls;
        return arrow::Status::IOError("still down");
      },
      Deterministic(), WithWaiter(waiter));

  assert(entitlement::util::KindOf(status) == ErrorKind::kRetryExhausted);

  milliseconds total{0};
  for (auto delay : waiter.delays) {
    assert(delay <= std::chrono::seconds(5));
    total += delay;
  }
  assert(total <= std::chrono::seconds(60));
  assert(calls == static_cast<int>(waiter.delays.size()) + 1);
  // 100 + 200 + 400 + 800 + 1600 + 3200 = 6300 ms, then 5 s steps up to 60 s.
  assert(waiter.delays.size() == 16);
}

void TestPermanentFailureIsReturnedUnchanged() {
  FakeWaiter   waiter;
  RetryOptions options = WithWaiter(waiter);
  options.retryable    = [](const arrow::Status& status) {
    return entitlement::util::KindOf(status) != ErrorKind::kInvalidCode;
  };

  int        calls  = 0;
  const auto status = Retry(
      [&] {
        ++calls;
        if (calls == 1) {
          return arrow::Status::IOError("transient");
        }
        return entitlement::util::MakeError(ErrorKind::kInvalidCode, arrow::StatusCode::Invalid, "bad code");
      },
      Deterministic(), options);

  assert(calls == 2);
  assert(status.IsInvalid());
  assert(entitlement::util::KindOf(status) == ErrorKind::kInvalidCode);
}

void TestNotifySeesEveryRetriedFailure() {
  FakeWaiter   waiter;
  RetryOptions options = WithWaiter(waiter);

  std::vector<std::string>  messages;
  std::vector<milliseconds> delays;
  options.notify = [&](const arrow::Status& error, milliseconds delay) {
    messages.push_back(error.message());
    delays.push_back(delay);
  };

  int        calls  = 0;
  const auto status = Retry(
      [&] {
        ++calls;
        return calls < 3 ? arrow::Status::IOError("failure ", calls) : arrow::Status::OK();
      },
      Deterministic(), options);

  assert(status.ok());
  assert((messages == std::vector<std::string>{"failure 1", "failure 2"}));
  assert(delays == waiter.delays);
}

void TestCancellationIsDistinctFromExhaustion() {
  FakeWaiter waiter;
  waiter.cancel_after = 2;

  const auto status = Retry([] { return arrow::Status::IOError("down"); }, Deterministic(), WithWaiter(waiter));

  assert(status.IsCancelled());
  assert(entitlement::util::KindOf(status) == ErrorKind::kCancelled);
  assert(entitlement::util::CauseOf(status).IsIOError());
}

void TestCancelledTokenStopsBeforeFirstAttempt() {
  FakeWaiter        waiter;
  CancellationToken token;
  token.Cancel();

  RetryOptions options = WithWaiter(waiter);
  options.cancel       = &token;

  int        calls  = 0;
  const auto status = Retry(
      [&] {
        ++calls;
        return arrow::Status::OK();
      },
      Deterministic(), options);

  assert(calls == 0);
  assert(entitlement::util::KindOf(status) == ErrorKind::kCancelled);
}

void TestDeadlineInterruptsRealWait() {
  // Real clock: the first backoff (10 s) outlasts the 100 ms deadline.
  auto policy             = BackoffPolicy::Default();
  policy.initial_interval = std::chrono::seconds(10);

  CancellationToken token(std::chrono::steady_clock::now() + milliseconds(100));
  RetryOptions      options;
  options.cancel = &token;

  const auto started = std::chrono::steady_clock::now();
  const auto status  = Retry([] { return arrow::Status::IOError("down"); }, policy, options);
  const auto waited  = std::chrono::steady_clock::now() - started;

  assert(entitlement::util::KindOf(status) == ErrorKind::kCancelled);
  assert(waited < std::chrono::seconds(5));
}

void TestCancelFromAnotherThreadWakesWaiter() {
  auto policy             = BackoffPolicy::Default();
  policy.initial_interval = std::chrono::seconds(30);
  policy.max_interval     = std::chrono::seconds(30);

  CancellationToken token;
  RetryOptions      options;
  options.cancel = &token;

  std::thread canceller([&] {
    std::this_thread::sleep_for(milliseconds(50));
    token.Cancel();
  });

  const auto started = std::chrono::steady_clock::now();
  const auto status  = Retry([] { return arrow::Status::IOError("down"); }, policy, options);
  const auto waited  = std::chrono::steady_clock::now() - started;
  canceller.join();

  assert(status.IsCancelled());
  assert(waited < std::chrono::seconds(10));
}

void TestRetryResultReturnsFirstValue() {
  FakeWaiter waiter;
  int        calls = 0;

  const auto result = entitlement::backoff::RetryResult<int>(
      [&]() -> arrow::Result<int> {
        ++calls;
        if (calls < 3) {
          return arrow::Status::IOError("not yet");
        }
        return calls * 10;
      },
      Deterministic(), WithWaiter(waiter));

  assert(result.ok());
  assert(*result == 30);
}

void TestInvalidPolicyThrows() {
  auto policy       = Deterministic();
  policy.multiplier = 0.1;

  bool threw = false;
  try {
    (void)Retry([] { return arrow::Status::OK(); }, policy);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSucceedsAfterTransientFailures();
  TestImmediateSuccessNeverWaits();
  TestExhaustedByAttempts();
  TestExhaustedByElapsedTime();
  TestPermanentFailureIsReturnedUnchanged();
  TestNotifySeesEveryRetriedFailure();
  TestCancellationIsDistinctFromExhaustion();
  TestCancelledTokenStopsBeforeFirstAttempt();
  TestDeadlineInterruptsRealWait();
  TestCancelFromAnotherThreadWakesWaiter();
  TestRetryResultReturnsFirstValue();
  TestInvalidPolicyThrows();

  std::cout << "entitlement_unit_retry: pass\n";
  return 0;
}
