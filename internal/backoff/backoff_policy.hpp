#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace entitlement::backoff {

/*
  Exponential backoff parameters. A plain value: the retry executor keeps
  all per-invocation state, so one policy can drive concurrent retries.
*/
struct BackoffPolicy {
  std::chrono::milliseconds initial_interval{500};
  double                    multiplier{1.5};
  std::chrono::milliseconds max_interval{std::chrono::seconds(60)};

  // nullopt = retry for as long as it takes.
  std::optional<std::chrono::milliseconds> max_elapsed_time{std::chrono::minutes(15)};
  std::optional<std::uint32_t>             max_attempts;

  // Each delay is drawn from [d * (1 - f), d * (1 + f)].
  double randomization_factor{0.5};

  static BackoffPolicy Default();

  // Short intervals and a short overall bound so tests fail instead of hanging.
  static BackoffPolicy Testing();

  // Throws std::invalid_argument for out-of-range parameters.
  void Validate() const;
};

// Delay before retry number `attempt` (1-based). jitter_sample is in [0, 1];
// 0.5 yields the unjittered delay.
std::chrono::milliseconds ComputeDelay(const BackoffPolicy& policy, std::uint32_t attempt, double jitter_sample);

} // namespace entitlement::backoff
