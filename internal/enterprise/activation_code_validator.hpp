#pragma once

#include <memory>
#include <optional>
#include <string>

#include <openssl/evp.h>

#include "internal/util/time.hpp"

namespace entitlement::enterprise {

// Facts proven by a successfully validated activation code.
struct ValidatedCode {
  // Absent when the code never expires.
  std::optional<util::TimePoint> expires;
};

/*
  Offline activation code check.

  Implementations must not perform network I/O and must not mutate any
  entitlement state. Rejections throw util::InvalidCode.
*/
class ActivationCodeValidator {
 public:
  virtual ~ActivationCodeValidator() = default;

  virtual ValidatedCode Validate(const std::string& activation_code) const = 0;
};

/*
  Verifies codes of the form

      base64({"token": "<json>", "signature": "<base64>"})

  where token is {"expiry": "<RFC 3339>"} and signature covers the exact
  token bytes. Ed25519 keys are verified directly, RSA and EC keys over
  SHA-256. Other key types are refused at construction.
*/
class SignedActivationCodeValidator final : public ActivationCodeValidator {
 public:
  // Throws util::InvalidConfig if public_key_pem is not a usable Ed25519,
  // RSA or EC public key.
  explicit SignedActivationCodeValidator(const std::string& public_key_pem, util::ClockFn clock = util::Now);

  ValidatedCode Validate(const std::string& activation_code) const override;

 private:
  bool VerifySignature(const std::string& message, const std::string& signature) const;

  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> public_key_;
  util::ClockFn                                       clock_;
};

// Strict standard base64 (with padding). Returns nullopt on malformed input.
std::optional<std::string> DecodeBase64(const std::string& encoded);
std::string                EncodeBase64(const std::string& raw);

} // namespace entitlement::enterprise
