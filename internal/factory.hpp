#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace entitlement::enterprise {
class ActivationCodeValidator;
class EntitlementStateMachine;
} // namespace entitlement::enterprise

namespace entitlement::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<entitlement::enterprise::EntitlementStateMachine> entitlements;
  std::vector<std::unique_ptr<::grpc::Service>>                       grpc_services;
};

/*
  Composition root: builds the validator from the configured public key
  and wires it through the state machine, service and gRPC adapter.
*/
Application Build(const entitlement::runtime::config::RuntimeConfig& config);

// Same graph around a caller-supplied validator.
Application Build(std::shared_ptr<const entitlement::enterprise::ActivationCodeValidator> validator);

} // namespace entitlement::factory
