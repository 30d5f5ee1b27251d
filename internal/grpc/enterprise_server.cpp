#include "enterprise_server.hpp"

#include "grpc_error.hpp"
#include "entitlement/manager/v1.hpp"

namespace entitlement::grpc {

EnterpriseServer::EnterpriseServer(std::shared_ptr<entitlement::service::EnterpriseService> svc) : service_(std::move(svc)) {
}

::grpc::Status EnterpriseServer::Activate(::grpc::ServerContext*, const entitlement::manager::v1::ActivateRequest* req,
                                          entitlement::manager::v1::ActivateResponse* resp) {
  try {
    *resp = service_->Activate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EnterpriseServer::Deactivate(::grpc::ServerContext*, const entitlement::manager::v1::DeactivateRequest* req,
                                            entitlement::manager::v1::DeactivateResponse* resp) {
  try {
    *resp = service_->Deactivate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EnterpriseServer::GetState(::grpc::ServerContext*, const entitlement::manager::v1::GetStateRequest* req,
                                          entitlement::manager::v1::GetStateResponse* resp) {
  try {
    *resp = service_->GetState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace entitlement::grpc
