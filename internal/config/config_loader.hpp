#pragma once

#include <string>

#include "config/config.pb.h"

namespace entitlement::config {

inline constexpr char kDefaultServiceName[]    = "entitlement-manager";
inline constexpr char kDefaultServiceVersion[] = ENTITLEMENT_VERSION;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static entitlement::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Returns the PEM public key named by the enterprise section, either the
  // inline public_key_pem or the contents of public_key_path. Setting both
  // or neither is an error.
  static std::string ResolvePublicKeyPem(const entitlement::runtime::config::RuntimeConfig& config);
};

} // namespace entitlement::config
