#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "client/cpp/enterprise_client.h"
#include "entitlement/manager/v1.hpp"
#include "internal/backoff/backoff_policy.hpp"
#include "internal/enterprise/activation_code_validator.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/status.hpp"
#include "internal/util/time.hpp"
#include "support/activation_signer.hpp"

namespace {

using entitlement::backoff::BackoffPolicy;
using entitlement::manager::client::EnterpriseClient;
using entitlement::manager::client::EntitlementState;
using entitlement::manager::client::ExpectState;
using entitlement::manager::v1::STATE_ACTIVE;
using entitlement::manager::v1::STATE_EXPIRED;
using entitlement::manager::v1::STATE_NONE;
using entitlement::util::ErrorKind;

// Stands in for a real license issuer: exactly one well-known code is valid.
class FixedCodeValidator final : public entitlement::enterprise::ActivationCodeValidator {
 public:
  entitlement::enterprise::ValidatedCode Validate(const std::string& activation_code) const override {
    if (activation_code != "E2E-CODE") {
      throw entitlement::util::InvalidCode("unknown activation code");
    }
    return {};
  }
};

struct RunningServer {
  explicit RunningServer(entitlement::factory::Application app)
      : server("127.0.0.1:0", std::move(app.grpc_services)) {
    server.Start();
  }

  std::string Address() const { return "127.0.0.1:" + std::to_string(server.Port()); }

  entitlement::runtime::Server server;
};

EntitlementState Await(const EnterpriseClient& client, entitlement::manager::v1::State expected) {
  auto state = client.AwaitState([&](const EntitlementState& actual) { return ExpectState(actual, expected); }, BackoffPolicy::Testing());
  if (!state.ok()) {
    std::cerr << state.status().ToString() << "\n";
  }
  assert(state.ok());
  return *state;
}

void TestActivationLifecycleConverges() {
  RunningServer running(entitlement::factory::Build(std::make_shared<FixedCodeValidator>()));
  auto          client = EnterpriseClient::Connect(running.Address());

  // Activate without expiry.
  auto effective = client->Activate("E2E-CODE");
  assert(effective.ok());
  assert(!*effective);

  auto state = Await(*client, STATE_ACTIVE);
  assert(state.activation_code == "E2E-CODE");
  assert(!state.expires);

  // Re-activate with an expiry in the past.
  const auto expires = entitlement::util::Now() - std::chrono::seconds(30);
  effective          = client->Activate("E2E-CODE", expires);
  assert(effective.ok());

  state = Await(*client, STATE_EXPIRED);
  assert(state.activation_code == "E2E-CODE");
  assert(state.expires);
  assert(entitlement::util::ToUnixSeconds(*state.expires) == entitlement::util::ToUnixSeconds(expires));

  // Deactivate twice; the second call is still a success.
  assert(client->Deactivate().ok());
  state = Await(*client, STATE_NONE);
  assert(state.activation_code.empty());
  assert(!state.expires);

  assert(client->Deactivate().ok());
  state = Await(*client, STATE_NONE);
}

void TestFutureExpiryRoundTrips() {
  RunningServer running(entitlement::factory::Build(std::make_shared<FixedCodeValidator>()));
  auto          client = EnterpriseClient::Connect(running.Address());

  const auto expires = entitlement::util::Now() + std::chrono::hours(24 * 365);
  assert(client->Activate("E2E-CODE", expires).ok());

  const auto state = Await(*client, STATE_ACTIVE);
  assert(entitlement::util::ToUnixSeconds(*state.expires) == entitlement::util::ToUnixSeconds(expires));
}

void TestInvalidCodeIsNotRetried() {
  RunningServer running(entitlement::factory::Build(std::make_shared<FixedCodeValidator>()));
  auto          client = EnterpriseClient::Connect(running.Address());

  const auto rejected = client->Activate("NOT-A-CODE");
  assert(!rejected.ok());
  assert(entitlement::util::KindOf(rejected.status()) == ErrorKind::kInvalidCode);

  const auto state = client->GetState();
  assert(state.ok());
  assert(state->state == STATE_NONE);
}

void TestAwaitMismatchExhausts() {
  RunningServer running(entitlement::factory::Build(std::make_shared<FixedCodeValidator>()));
  auto          client = EnterpriseClient::Connect(running.Address());

  auto policy         = BackoffPolicy::Testing();
  policy.max_attempts = 3;

  const auto state = client->AwaitState([](const EntitlementState& actual) { return ExpectState(actual, STATE_ACTIVE); }, policy);
  assert(!state.ok());
  assert(entitlement::util::KindOf(state.status()) == ErrorKind::kRetryExhausted);
}

void TestUnreachableServiceIsTransient() {
  int unused_port = 0;
  {
    RunningServer probe(entitlement::factory::Build(std::make_shared<FixedCodeValidator>()));
    unused_port = probe.server.Port();
  }

  EnterpriseClient client(
      ::grpc::CreateChannel("127.0.0.1:" + std::to_string(unused_port), ::grpc::InsecureChannelCredentials()),
      std::chrono::milliseconds(500));

  auto policy         = BackoffPolicy::Testing();
  policy.max_attempts = 2;

  const auto state = client.AwaitState([](const EntitlementState& actual) { return ExpectState(actual, STATE_NONE); }, policy);
  assert(!state.ok());
  assert(entitlement::util::KindOf(state.status()) == ErrorKind::kRetryExhausted);
  assert(entitlement::util::KindOf(entitlement::util::CauseOf(state.status())) == ErrorKind::kTransientUnavailable);
}

void TestSignedCodesThroughConfiguredValidator() {
  entitlement::testing::ActivationSigner signer;

  entitlement::runtime::config::RuntimeConfig config;
  config.mutable_enterprise()->set_public_key_pem(signer.PublicKeyPem());

  RunningServer running(entitlement::factory::Build(config));
  auto          client = EnterpriseClient::Connect(running.Address());

  const auto code_expiry = entitlement::util::Now() + std::chrono::hours(1);
  const auto code        = signer.Issue(code_expiry);

  // A requested expiry beyond the code's own is capped to it.
  auto effective = client->Activate(code, code_expiry + std::chrono::hours(24));
  assert(effective.ok());
  assert(*effective);
  assert(entitlement::util::ToUnixSeconds(**effective) == entitlement::util::ToUnixSeconds(code_expiry));

  auto state = Await(*client, STATE_ACTIVE);
  assert(state.activation_code == code);

  assert(entitlement::util::KindOf(client->Activate("E2E-CODE").status()) == ErrorKind::kInvalidCode);
  state = Await(*client, STATE_ACTIVE);
  assert(state.activation_code == code);
}

} // namespace

int main() {
  TestActivationLifecycleConverges();
  TestFutureExpiryRoundTrips();
  TestInvalidCodeIsNotRetried();
  TestAwaitMismatchExhausts();
  TestUnreachableServiceIsTransient();
  TestSignedCodesThroughConfiguredValidator();

  std::cout << "entitlement_integration_convergence: pass\n";
  return 0;
}
