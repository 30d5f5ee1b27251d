#include "entitlement_state_machine.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace entitlement::enterprise {

namespace {

std::optional<util::TimePoint> EffectiveExpiry(std::optional<util::TimePoint> requested, std::optional<util::TimePoint> code_expiry) {
  if (!requested) {
    return code_expiry;
  }
  if (code_expiry && *code_expiry < *requested) {
    return code_expiry;
  }
  return requested;
}

} // namespace

EntitlementStateMachine::EntitlementStateMachine(std::shared_ptr<const ActivationCodeValidator> validator, util::ClockFn clock)
    : validator_(std::move(validator)), clock_(std::move(clock)) {
  if (!validator_) {
    throw std::invalid_argument("EntitlementStateMachine requires an activation code validator");
  }
}

EntitlementRecord EntitlementStateMachine::Activate(const std::string& activation_code, std::optional<util::TimePoint> expires) {
  const auto validated = validator_->Validate(activation_code);

  EntitlementRecord next;
  next.activation_code = activation_code;
  next.expires_at      = EffectiveExpiry(expires, validated.expires);

  LicenseState from;
  LicenseState to;
  {
    std::lock_guard lock(mutex_);
    const auto      now = clock_();
    from                = DeriveState(record_, now);
    record_             = next;
    to                  = DeriveState(record_, now);
  }

  ENTITLEMENT_LOG_INFO("Activation code accepted",
                       {entitlement::observability::RedactedField("activation_code", activation_code),
                        entitlement::observability::StringField("expires", next.expires_at ? util::FormatRfc3339(*next.expires_at) : "never")});
  RecordTransition(from, to);
  return next;
}

void EntitlementStateMachine::Deactivate() {
  LicenseState from;
  {
    std::lock_guard lock(mutex_);
    from    = DeriveState(record_, clock_());
    record_ = EntitlementRecord{};
  }

  RecordTransition(from, LicenseState::kNone);
}

EntitlementSnapshot EntitlementStateMachine::GetState() const {
  std::lock_guard lock(mutex_);

  EntitlementSnapshot snapshot;
  snapshot.record = record_;
  snapshot.state  = DeriveState(record_, clock_());
  return snapshot;
}

void EntitlementStateMachine::RecordTransition(LicenseState from, LicenseState to) const {
  if (from == to) {
    return;
  }

  ENTITLEMENT_LOG_INFO("Entitlement state changed", {entitlement::observability::StringField("from", ToString(from)),
                                                     entitlement::observability::StringField("to", ToString(to))});
  entitlement::observability::Metrics::Instance().RecordStateTransition(ToString(from), ToString(to));
}

} // namespace entitlement::enterprise
