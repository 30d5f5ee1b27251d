#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace entitlement::enterprise {

enum class LicenseState : std::uint8_t {
  kNone    = 0,
  kActive  = 1,
  kExpired = 2,
};

/*
  The single mutable entity of a service instance.

  activation_code absent  => NONE
  expires_at absent       => never expires
*/
struct EntitlementRecord {
  std::optional<std::string>     activation_code;
  std::optional<util::TimePoint> expires_at;
};

// Derived state together with the record it was derived from.
struct EntitlementSnapshot {
  LicenseState      state{LicenseState::kNone};
  EntitlementRecord record;
};

// Throws util::StateInconsistent when the record breaks its invariants.
LicenseState DeriveState(const EntitlementRecord& record, util::TimePoint now);

std::string_view ToString(LicenseState state);

} // namespace entitlement::enterprise
