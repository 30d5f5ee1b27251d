#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "entitlement/manager/v1.hpp"
#include "internal/backoff/retry.hpp"
#include "internal/util/time.hpp"

namespace entitlement::manager::client {

// Default development endpoint, used outside a cluster.
inline constexpr char kDefaultDevelopmentAddress[] = "localhost:30650";

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> GetEnv(const std::string& name);

struct Endpoint {
  std::string address;
  bool        in_cluster{false};
};

// In-cluster: ENTITLEMENT_SERVICE_HOST / ENTITLEMENT_SERVICE_PORT (both required).
arrow::Result<Endpoint> InClusterEndpoint(const EnvLookup& env = GetEnv);

// Development: ENTITLEMENT_ADDRESS, else kDefaultDevelopmentAddress.
Endpoint DevelopmentEndpoint(const EnvLookup& env = GetEnv);

// In-cluster when ENTITLEMENT_PORT_650_TCP_ADDR is set, development otherwise.
arrow::Result<Endpoint> DiscoverEndpoint(const EnvLookup& env = GetEnv);

// Maps a gRPC status onto arrow::Status with an util::ErrorKind detail.
arrow::Status FromGrpc(const ::grpc::Status& status, std::string_view action);

struct EntitlementState {
  entitlement::manager::v1::State state{entitlement::manager::v1::STATE_NONE};
  std::string                     activation_code;
  std::optional<util::TimePoint>  expires;
};

/*
  Client handle for EnterpriseService.

  Construction opens the channel, which is the expensive part: build one
  per process (or per test suite) and pass it to whoever needs it. All
  calls are const and safe to issue concurrently.
*/
class EnterpriseClient {
 public:
  static constexpr std::chrono::milliseconds kDefaultRpcTimeout{std::chrono::seconds(10)};

  explicit EnterpriseClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds rpc_timeout = kDefaultRpcTimeout);

  static std::unique_ptr<EnterpriseClient>                 Connect(const std::string& address);
  static arrow::Result<std::unique_ptr<EnterpriseClient>> NewInCluster();
  static std::unique_ptr<EnterpriseClient>                 NewForTest();
  static arrow::Result<std::unique_ptr<EnterpriseClient>> NewFromEnvironment();

  // Returns the effective expiry recorded by the service (nullopt = never).
  arrow::Result<std::optional<util::TimePoint>> Activate(const std::string&             activation_code,
                                                         std::optional<util::TimePoint> expires = std::nullopt) const;

  arrow::Status Deactivate() const;

  arrow::Result<EntitlementState> GetState() const;

  // Polls GetState through RetryWithBackoff until `check` accepts the
  // state. InvalidCode and StateInconsistent end the wait at once unless
  // options.retryable says otherwise.
  arrow::Result<EntitlementState> AwaitState(const std::function<arrow::Status(const EntitlementState&)>& check,
                                             const entitlement::backoff::BackoffPolicy&                    policy,
                                             entitlement::backoff::RetryOptions                            options = {}) const;

 private:
  void PrepareContext(::grpc::ClientContext* ctx) const;

  std::unique_ptr<entitlement::manager::v1::EnterpriseService::Stub> stub_;
  std::chrono::milliseconds                                          rpc_timeout_;
};

// Check helpers for AwaitState.
arrow::Status ExpectState(const EntitlementState& actual, entitlement::manager::v1::State expected);

} // namespace entitlement::manager::client
