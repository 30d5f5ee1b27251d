#pragma once

#include "entitlement/manager/v1/enterprise.pb.h"
#include "service_context.hpp"

namespace entitlement::service {

/*
  RPC-facing facade over the entitlement state machine. Each call is one
  self-contained transaction against the record; the state machine's lock
  never escapes.
*/
class EnterpriseService {
 public:
  explicit EnterpriseService(ServiceContext ctx);

  entitlement::manager::v1::ActivateResponse Activate(const entitlement::manager::v1::ActivateRequest& req);

  entitlement::manager::v1::DeactivateResponse Deactivate(const entitlement::manager::v1::DeactivateRequest& req);

  entitlement::manager::v1::GetStateResponse GetState(const entitlement::manager::v1::GetStateRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace entitlement::service
