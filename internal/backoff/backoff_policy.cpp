#include "backoff_policy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace entitlement::backoff {

BackoffPolicy BackoffPolicy::Default() {
  return BackoffPolicy{};
}

BackoffPolicy BackoffPolicy::Testing() {
  BackoffPolicy policy;
  policy.initial_interval = std::chrono::milliseconds(100);
  policy.max_interval     = std::chrono::seconds(5);
  policy.max_elapsed_time = std::chrono::seconds(60);
  return policy;
}

void BackoffPolicy::Validate() const {
  if (initial_interval.count() <= 0) {
    throw std::invalid_argument("backoff initial_interval must be positive");
  }
  if (multiplier < 1.0) {
    throw std::invalid_argument("backoff multiplier must be >= 1");
  }
  if (max_interval < initial_interval) {
    throw std::invalid_argument("backoff max_interval must be >= initial_interval");
  }
  if (randomization_factor < 0.0 || randomization_factor > 1.0) {
    throw std::invalid_argument("backoff randomization_factor must be within [0, 1]");
  }
  if (max_attempts && *max_attempts == 0) {
    throw std::invalid_argument("backoff max_attempts must be positive when set");
  }
}

std::chrono::milliseconds ComputeDelay(const BackoffPolicy& policy, std::uint32_t attempt, double jitter_sample) {
  const double cap = static_cast<double>(policy.max_interval.count());

  double base = static_cast<double>(policy.initial_interval.count());
  for (std::uint32_t i = 1; i < attempt && base < cap; ++i) {
    base *= policy.multiplier;
  }
  base = std::min(base, cap);

  const double sample = std::clamp(jitter_sample, 0.0, 1.0);
  const double delta  = base * policy.randomization_factor;
  const double value  = std::clamp((base - delta) + sample * 2.0 * delta, 0.0, cap);

  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(value)));
}

} // namespace entitlement::backoff
