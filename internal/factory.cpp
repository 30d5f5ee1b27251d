#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/enterprise/activation_code_validator.hpp"
#include "internal/enterprise/entitlement_state_machine.hpp"
#include "internal/grpc/enterprise_server.hpp"
#include "internal/service/enterprise_service.hpp"
#include "internal/service/service_context.hpp"

namespace entitlement::factory {

using namespace entitlement;

Application Build(const entitlement::runtime::config::RuntimeConfig& config) {
  auto validator =
      std::make_shared<enterprise::SignedActivationCodeValidator>(entitlement::config::ConfigLoader::ResolvePublicKeyPem(config));
  return Build(std::move(validator));
}

Application Build(std::shared_ptr<const enterprise::ActivationCodeValidator> validator) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.entitlements = std::make_shared<enterprise::EntitlementStateMachine>(std::move(validator));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.entitlements = app.entitlements;

  auto enterprise_service = std::make_shared<service::EnterpriseService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<entitlement::grpc::EnterpriseServer>(enterprise_service));

  return app;
}

} // namespace entitlement::factory
