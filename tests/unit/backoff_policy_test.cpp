#include "internal/backoff/backoff_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace {

using entitlement::backoff::BackoffPolicy;
using entitlement::backoff::ComputeDelay;
using std::chrono::milliseconds;

constexpr double kNoJitter = 0.5;

bool Rejected(const BackoffPolicy& policy) {
  try {
    policy.Validate();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestDefaults() {
  const auto policy = BackoffPolicy::Default();
  assert(policy.initial_interval == milliseconds(500));
  assert(policy.multiplier == 1.5);
  assert(policy.max_interval == std::chrono::seconds(60));
  assert(policy.max_elapsed_time == milliseconds(std::chrono::minutes(15)));
  assert(!policy.max_attempts);
  assert(policy.randomization_factor == 0.5);
  policy.Validate();
}

void TestTestingPolicyIsTight() {
  const auto policy = BackoffPolicy::Testing();
  assert(policy.initial_interval == milliseconds(100));
  assert(policy.max_interval == std::chrono::seconds(5));
  assert(policy.max_elapsed_time == milliseconds(std::chrono::seconds(60)));
  policy.Validate();
}

void TestExponentialGrowth() {
  const auto policy = BackoffPolicy::Default();
  assert(ComputeDelay(policy, 1, kNoJitter) == milliseconds(500));
  assert(ComputeDelay(policy, 2, kNoJitter) == milliseconds(750));
  assert(ComputeDelay(policy, 3, kNoJitter) == milliseconds(1125));
}

void TestDelayIsCapped() {
  const auto policy = BackoffPolicy::Default();
  assert(ComputeDelay(policy, 50, kNoJitter) == std::chrono::seconds(60));
  assert(ComputeDelay(policy, 1'000'000, kNoJitter) == std::chrono::seconds(60));

  // Jitter above the cap is clamped back to it.
  assert(ComputeDelay(policy, 50, 1.0) == std::chrono::seconds(60));
  assert(ComputeDelay(policy, 50, 0.0) == std::chrono::seconds(30));
}

void TestJitterBounds() {
  const auto policy = BackoffPolicy::Default();
  assert(ComputeDelay(policy, 1, 0.0) == milliseconds(250));
  assert(ComputeDelay(policy, 1, 1.0) == milliseconds(750));

  for (double sample = 0.0; sample <= 1.0; sample += 0.125) {
    const auto delay = ComputeDelay(policy, 2, sample);
    assert(delay >= milliseconds(375));
    assert(delay <= milliseconds(1125));
  }
}

void TestZeroRandomizationIsDeterministic() {
  auto policy                 = BackoffPolicy::Testing();
  policy.randomization_factor = 0.0;
  policy.multiplier           = 2.0;

  assert(ComputeDelay(policy, 1, 0.0) == milliseconds(100));
  assert(ComputeDelay(policy, 2, 1.0) == milliseconds(200));
  assert(ComputeDelay(policy, 7, 0.3) == milliseconds(5000));
}

void TestValidateRejectsBadParameters() {
  auto policy             = BackoffPolicy::Default();
  policy.initial_interval = milliseconds(0);
  assert(Rejected(policy));

  policy            = BackoffPolicy::Default();
  policy.multiplier = 0.5;
  assert(Rejected(policy));

  policy              = BackoffPolicy::Default();
  policy.max_interval = milliseconds(100);
  assert(Rejected(policy));

  policy                      = BackoffPolicy::Default();
  policy.randomization_factor = 1.5;
  assert(Rejected(policy));

  policy              = BackoffPolicy::Default();
  policy.max_attempts = 0;
  assert(Rejected(policy));

  policy                  = BackoffPolicy::Default();
  policy.max_elapsed_time = std::nullopt;
  policy.max_attempts     = 3;
  assert(!Rejected(policy));
}

} // namespace

int main() {
  TestDefaults();
  TestTestingPolicyIsTight();
  TestExponentialGrowth();
  TestDelayIsCapped();
  TestJitterBounds();
  TestZeroRandomizationIsDeterministic();
  TestValidateRejectsBadParameters();

  std::cout << "entitlement_unit_backoff_policy: pass\n";
  return 0;
}
