#include "license_state.hpp"

#include "internal/util/errors.hpp"

namespace entitlement::enterprise {

LicenseState DeriveState(const EntitlementRecord& record, util::TimePoint now) {
  if (!record.activation_code) {
    if (record.expires_at) {
      throw util::StateInconsistent("entitlement record has an expiry but no activation code");
    }
    return LicenseState::kNone;
  }

  if (record.expires_at && *record.expires_at <= now) {
    return LicenseState::kExpired;
  }
  return LicenseState::kActive;
}

std::string_view ToString(LicenseState state) {
  switch (state) {
    case LicenseState::kNone:
      return "NONE";
    case LicenseState::kActive:
      return "ACTIVE";
    case LicenseState::kExpired:
      return "EXPIRED";
  }
  return "UNKNOWN";
}

} // namespace entitlement::enterprise
