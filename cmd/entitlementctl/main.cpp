#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "client/cpp/enterprise_client.h"
#include "entitlement/manager/v1.hpp"
#include "internal/backoff/retry.hpp"
#include "internal/util/status.hpp"
#include "internal/util/time.hpp"

using namespace entitlement::manager::v1;
using entitlement::manager::client::EnterpriseClient;
using entitlement::manager::client::EntitlementState;

static void Usage() {
  std::cout << "Usage:\n"
            << "  entitlementctl [--address <host:port>] activate <activation_code> [expires=RFC3339]\n"
            << "  entitlementctl [--address <host:port>] deactivate\n"
            << "  entitlementctl [--address <host:port>] state\n"
            << "  entitlementctl [--address <host:port>] wait <none|active|expired> [timeout_s]\n"
            << "\n"
            << "Without --address the endpoint is discovered from the environment.\n";
}

static std::optional<State> ParseState(const std::string& value) {
  if (value == "none") {
    return STATE_NONE;
  }
  if (value == "active") {
    return STATE_ACTIVE;
  }
  if (value == "expired") {
    return STATE_EXPIRED;
  }
  return std::nullopt;
}

static void PrintState(const EntitlementState& state) {
  std::cout << "state=" << State_Name(state.state) << "\n";
  if (state.state == STATE_NONE) {
    return;
  }
  std::cout << "activation_code=" << state.activation_code << "\n";
  std::cout << "expires=" << (state.expires ? entitlement::util::FormatRfc3339(*state.expires) : std::string("never")) << "\n";
}

static int Fail(const arrow::Status& status) {
  std::cerr << status.message() << "\n";
  return entitlement::util::KindOf(status) == entitlement::util::ErrorKind::kInvalidCode ? 3 : 2;
}

int main(int argc, char** argv) {
  int         next = 1;
  std::string address;
  if (argc >= 3 && std::string(argv[1]) == "--address") {
    address = argv[2];
    next    = 3;
  }

  if (argc <= next) {
    Usage();
    return 1;
  }

  std::unique_ptr<EnterpriseClient> client;
  if (!address.empty()) {
    client = EnterpriseClient::Connect(address);
  } else {
    auto discovered = EnterpriseClient::NewFromEnvironment();
    if (!discovered.ok()) {
      return Fail(discovered.status());
    }
    client = std::move(discovered).ValueOrDie();
  }

  const std::string cmd = argv[next];

  // ------------------------------------------------------------

  if (cmd == "activate") {
    if (argc < next + 2) {
      Usage();
      return 1;
    }

    std::optional<entitlement::util::TimePoint> expires;
    if (argc >= next + 3) {
      expires = entitlement::util::ParseRfc3339(argv[next + 2]);
      if (!expires) {
        std::cerr << "invalid expiry (want RFC 3339): " << argv[next + 2] << "\n";
        return 1;
      }
    }

    auto effective = client->Activate(argv[next + 1], expires);
    if (!effective.ok()) {
      return Fail(effective.status());
    }

    std::cout << "activated, expires="
              << (effective.ValueUnsafe() ? entitlement::util::FormatRfc3339(*effective.ValueUnsafe()) : std::string("never")) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deactivate") {
    auto status = client->Deactivate();
    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "deactivated\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "state") {
    auto state = client->GetState();
    if (!state.ok()) {
      return Fail(state.status());
    }

    PrintState(state.ValueUnsafe());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "wait") {
    if (argc < next + 2) {
      Usage();
      return 1;
    }

    auto expected = ParseState(argv[next + 1]);
    if (!expected) {
      std::cerr << "unsupported state: " << argv[next + 1] << "\n";
      return 1;
    }

    auto policy = entitlement::backoff::BackoffPolicy::Default();
    if (argc >= next + 3) {
      policy.max_elapsed_time = std::chrono::seconds(std::stoll(argv[next + 2]));
    }

    entitlement::backoff::RetryOptions options;
    options.notify = [](const arrow::Status& error, std::chrono::milliseconds delay) {
      std::cerr << "waiting " << delay.count() << "ms: " << error.message() << "\n";
    };

    auto state = client->AwaitState(
        [&](const EntitlementState& actual) { return entitlement::manager::client::ExpectState(actual, *expected); }, policy, options);
    if (!state.ok()) {
      return Fail(state.status());
    }

    PrintState(state.ValueUnsafe());
    return 0;
  }

  Usage();
  return 1;
}
