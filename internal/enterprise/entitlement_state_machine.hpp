#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "activation_code_validator.hpp"
#include "license_state.hpp"
#include "internal/util/time.hpp"

namespace entitlement::enterprise {

/*
  Owns the entitlement record of one service instance.

  State is never stored: every read derives NONE / ACTIVE / EXPIRED from
  the record against the clock, so expiry needs no timer. All operations
  are serialized by one mutex; the validator runs before it is taken.
*/
class EntitlementStateMachine {
 public:
  explicit EntitlementStateMachine(std::shared_ptr<const ActivationCodeValidator> validator, util::ClockFn clock = util::Now);

  // Validates the code, then overwrites the record (last writer wins).
  // The stored expiry is the requested one, capped by the code's own
  // expiry. Throws util::InvalidCode and leaves the record untouched on
  // rejection. Returns the record that was written.
  EntitlementRecord Activate(const std::string& activation_code, std::optional<util::TimePoint> expires);

  // Clears the record. Succeeds when nothing is active.
  void Deactivate();

  EntitlementSnapshot GetState() const;

 private:
  void RecordTransition(LicenseState from, LicenseState to) const;

  std::shared_ptr<const ActivationCodeValidator> validator_;
  util::ClockFn                                  clock_;

  mutable std::mutex mutex_;
  EntitlementRecord  record_;
};

} // namespace entitlement::enterprise
