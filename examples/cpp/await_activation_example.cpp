#include <chrono>
#include <iostream>
#include <string>

#include "client/cpp/enterprise_client.h"
#include "entitlement/manager/v1.hpp"
#include "internal/backoff/backoff_policy.hpp"
#include "internal/util/time.hpp"

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: await_activation_example <activation_code>\n";
    return 1;
  }

  // Endpoint comes from the environment: in-cluster service variables, or
  // ENTITLEMENT_ADDRESS / localhost:30650 during development.
  auto client = entitlement::manager::client::EnterpriseClient::NewFromEnvironment();
  if (!client.ok()) {
    std::cerr << "endpoint discovery failed: " << client.status().ToString() << '\n';
    return 1;
  }

  auto activated = (*client)->Activate(argv[1]);
  if (!activated.ok()) {
    std::cerr << "Activate failed: " << activated.status().ToString() << '\n';
    return 1;
  }

  // Activation is observed, not assumed: poll until the service reports it.
  entitlement::backoff::RetryOptions options;
  options.notify = [](const arrow::Status& error, std::chrono::milliseconds delay) {
    std::cerr << "not active yet (" << error.message() << "), retrying in " << delay.count() << "ms\n";
  };

  auto state = (*client)->AwaitState(
      [](const entitlement::manager::client::EntitlementState& actual) {
        return entitlement::manager::client::ExpectState(actual, entitlement::manager::v1::STATE_ACTIVE);
      },
      entitlement::backoff::BackoffPolicy::Default(), options);
  if (!state.ok()) {
    std::cerr << "entitlement did not become active: " << state.status().ToString() << '\n';
    return 1;
  }

  std::cout << "enterprise features active";
  if (state->expires) {
    std::cout << " until " << entitlement::util::FormatRfc3339(*state->expires);
  }
  std::cout << '\n';
  return 0;
}
