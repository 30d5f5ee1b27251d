#pragma once

#include <stdexcept>
#include <string>

namespace entitlement::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Activation code failed offline validation. Never retried.
class InvalidCode : public std::runtime_error {
 public:
  explicit InvalidCode(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Internal invariant violation. Should be unreachable.
class StateInconsistent : public std::runtime_error {
 public:
  explicit StateInconsistent(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed request field, e.g. an out-of-range timestamp.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace entitlement::util
