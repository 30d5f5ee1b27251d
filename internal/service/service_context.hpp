#pragma once

#include <memory>

namespace entitlement::enterprise {
class EntitlementStateMachine;
}

namespace entitlement::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<entitlement::enterprise::EntitlementStateMachine> entitlements;
};

} // namespace entitlement::service
