#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "entitlement/manager/v1/enterprise.grpc.pb.h"
#include "internal/service/enterprise_service.hpp"

namespace entitlement::grpc {

class EnterpriseServer final : public entitlement::manager::v1::EnterpriseService::Service {
 public:
  explicit EnterpriseServer(std::shared_ptr<entitlement::service::EnterpriseService> svc);

  ::grpc::Status Activate(::grpc::ServerContext*, const entitlement::manager::v1::ActivateRequest*,
                          entitlement::manager::v1::ActivateResponse*) override;

  ::grpc::Status Deactivate(::grpc::ServerContext*, const entitlement::manager::v1::DeactivateRequest*,
                            entitlement::manager::v1::DeactivateResponse*) override;

  ::grpc::Status GetState(::grpc::ServerContext*, const entitlement::manager::v1::GetStateRequest*,
                          entitlement::manager::v1::GetStateResponse*) override;

 private:
  std::shared_ptr<entitlement::service::EnterpriseService> service_;
};

} // namespace entitlement::grpc
