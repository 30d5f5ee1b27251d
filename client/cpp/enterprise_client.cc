#include "client/cpp/enterprise_client.h"

#include <cstdlib>
#include <string>
#include <utility>

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/util/status.hpp"

namespace entitlement::manager::client {

namespace {

using entitlement::util::ErrorKind;
using entitlement::util::MakeError;

std::optional<std::string> NonEmpty(const EnvLookup& env, const std::string& name) {
  auto value = env(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return value;
}

arrow::Result<util::TimePoint> ExpiryFromProto(const google::protobuf::Timestamp& ts) {
  if (!util::IsValidTimestamp(ts)) {
    return MakeError(ErrorKind::kStateInconsistent, arrow::StatusCode::UnknownError, "server reported an out-of-range expiry");
  }
  return util::FromProto(ts);
}

} // namespace

std::optional<std::string> GetEnv(const std::string& name) {
  if (const char* value = std::getenv(name.c_str())) {
    return std::string(value);
  }
  return std::nullopt;
}

arrow::Result<Endpoint> InClusterEndpoint(const EnvLookup& env) {
  const auto host = NonEmpty(env, "ENTITLEMENT_SERVICE_HOST");
  const auto port = NonEmpty(env, "ENTITLEMENT_SERVICE_PORT");
  if (!host || !port) {
    return arrow::Status::Invalid("in-cluster discovery requires ENTITLEMENT_SERVICE_HOST and ENTITLEMENT_SERVICE_PORT");
  }
  return Endpoint{*host + ":" + *port, true};
}

Endpoint DevelopmentEndpoint(const EnvLookup& env) {
  if (auto address = NonEmpty(env, "ENTITLEMENT_ADDRESS")) {
    return Endpoint{*address, false};
  }
  return Endpoint{kDefaultDevelopmentAddress, false};
}

arrow::Result<Endpoint> DiscoverEndpoint(const EnvLookup& env) {
  if (NonEmpty(env, "ENTITLEMENT_PORT_650_TCP_ADDR")) {
    return InClusterEndpoint(env);
  }
  return DevelopmentEndpoint(env);
}

arrow::Status FromGrpc(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }

  const std::string message = std::string(action) + " failed: " + status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      return MakeError(ErrorKind::kInvalidCode, arrow::StatusCode::Invalid, message);
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return MakeError(ErrorKind::kTransientUnavailable, arrow::StatusCode::IOError, message);
    case ::grpc::StatusCode::DATA_LOSS:
      return MakeError(ErrorKind::kStateInconsistent, arrow::StatusCode::UnknownError, message);
    case ::grpc::StatusCode::CANCELLED:
      return arrow::Status::Cancelled(message);
    default:
      return arrow::Status::IOError(message);
  }
}

arrow::Status ExpectState(const EntitlementState& actual, entitlement::manager::v1::State expected) {
  if (actual.state == expected) {
    return arrow::Status::OK();
  }
  return arrow::Status::Invalid("expected enterprise state to be ", entitlement::manager::v1::State_Name(expected), " but was ",
                                entitlement::manager::v1::State_Name(actual.state));
}

EnterpriseClient::EnterpriseClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds rpc_timeout)
    : stub_(entitlement::manager::v1::EnterpriseService::NewStub(std::move(channel))), rpc_timeout_(rpc_timeout) {
}

std::unique_ptr<EnterpriseClient> EnterpriseClient::Connect(const std::string& address) {
  return std::make_unique<EnterpriseClient>(::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials()));
}

arrow::Result<std::unique_ptr<EnterpriseClient>> EnterpriseClient::NewInCluster() {
  ARROW_ASSIGN_OR_RAISE(auto endpoint, InClusterEndpoint());
  return Connect(endpoint.address);
}

std::unique_ptr<EnterpriseClient> EnterpriseClient::NewForTest() {
  return Connect(DevelopmentEndpoint().address);
}

arrow::Result<std::unique_ptr<EnterpriseClient>> EnterpriseClient::NewFromEnvironment() {
  ARROW_ASSIGN_OR_RAISE(auto endpoint, DiscoverEndpoint());
  return Connect(endpoint.address);
}

void EnterpriseClient::PrepareContext(::grpc::ClientContext* ctx) const {
  ctx->set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
}

arrow::Result<std::optional<util::TimePoint>> EnterpriseClient::Activate(const std::string&             activation_code,
                                                                         std::optional<util::TimePoint> expires) const {
  entitlement::manager::v1::ActivateRequest req;
  req.set_activation_code(activation_code);
  if (expires) {
    *req.mutable_expires() = util::ToProto(*expires);
  }

  entitlement::manager::v1::ActivateResponse resp;
  ::grpc::ClientContext                      ctx;
  PrepareContext(&ctx);
  ARROW_RETURN_NOT_OK(FromGrpc(stub_->Activate(&ctx, req, &resp), "Activate"));

  std::optional<util::TimePoint> effective;
  if (resp.info().has_expires()) {
    ARROW_ASSIGN_OR_RAISE(effective, ExpiryFromProto(resp.info().expires()));
  }
  return effective;
}

arrow::Status EnterpriseClient::Deactivate() const {
  entitlement::manager::v1::DeactivateRequest  req;
  entitlement::manager::v1::DeactivateResponse resp;
  ::grpc::ClientContext                        ctx;
  PrepareContext(&ctx);
  return FromGrpc(stub_->Deactivate(&ctx, req, &resp), "Deactivate");
}

arrow::Result<EntitlementState> EnterpriseClient::GetState() const {
  entitlement::manager::v1::GetStateRequest  req;
  entitlement::manager::v1::GetStateResponse resp;
  ::grpc::ClientContext                      ctx;
  PrepareContext(&ctx);
  ARROW_RETURN_NOT_OK(FromGrpc(stub_->GetState(&ctx, req, &resp), "GetState"));

  EntitlementState state;
  state.state           = resp.state();
  state.activation_code = resp.activation_code();
  if (resp.info().has_expires()) {
    ARROW_ASSIGN_OR_RAISE(state.expires, ExpiryFromProto(resp.info().expires()));
  }
  return state;
}

arrow::Result<EntitlementState> EnterpriseClient::AwaitState(const std::function<arrow::Status(const EntitlementState&)>& check,
                                                             const entitlement::backoff::BackoffPolicy&                    policy,
                                                             entitlement::backoff::RetryOptions                            options) const {
  if (!options.retryable) {
    options.retryable = [](const arrow::Status& status) {
      const auto kind = entitlement::util::KindOf(status);
      return kind != ErrorKind::kInvalidCode && kind != ErrorKind::kStateInconsistent;
    };
  }

  return entitlement::backoff::RetryResult<EntitlementState>(
      [&]() -> arrow::Result<EntitlementState> {
        ARROW_ASSIGN_OR_RAISE(auto state, GetState());
        ARROW_RETURN_NOT_OK(check(state));
        return state;
      },
      policy, options);
}

} // namespace entitlement::manager::client
