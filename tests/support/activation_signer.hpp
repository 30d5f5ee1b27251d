#pragma once

/*
  Test-only activation code issuer.

  Generates an Ed25519 key pair in memory and produces codes in the same
  envelope SignedActivationCodeValidator accepts. Nothing here ships in a
  library target.
*/

#include <google/protobuf/util/json_util.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "entitlement/manager/v1.hpp"
#include "internal/enterprise/activation_code_validator.hpp"
#include "internal/util/time.hpp"

namespace entitlement::testing {

inline void Check(bool ok, const char* what) {
  if (!ok) {
    throw std::runtime_error(std::string("activation signer: ") + what);
  }
}

class ActivationSigner {
 public:
  // key_type must be a signing algorithm for Sign/Issue; other types only
  // serve PublicKeyPem.
  explicit ActivationSigner(int key_type = EVP_PKEY_ED25519) : key_(nullptr, EVP_PKEY_free) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(EVP_PKEY_CTX_new_id(key_type, nullptr), EVP_PKEY_CTX_free);
    Check(ctx != nullptr, "EVP_PKEY_CTX_new_id");
    Check(EVP_PKEY_keygen_init(ctx.get()) == 1, "EVP_PKEY_keygen_init");

    EVP_PKEY* key = nullptr;
    Check(EVP_PKEY_keygen(ctx.get(), &key) == 1, "EVP_PKEY_keygen");
    key_.reset(key);
  }

  std::string PublicKeyPem() const {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
    Check(bio && PEM_write_bio_PUBKEY(bio.get(), key_.get()) == 1, "PEM_write_bio_PUBKEY");

    char*      data = nullptr;
    const long size = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<std::size_t>(size));
  }

  std::string Sign(const std::string& message) const {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    Check(ctx && EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) == 1, "EVP_DigestSignInit");

    std::size_t size = 0;
    Check(EVP_DigestSign(ctx.get(), nullptr, &size, reinterpret_cast<const unsigned char*>(message.data()), message.size()) == 1,
          "EVP_DigestSign size");

    std::string signature(size, '\0');
    Check(EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()), &size,
                         reinterpret_cast<const unsigned char*>(message.data()), message.size()) == 1,
          "EVP_DigestSign");
    signature.resize(size);
    return signature;
  }

  static std::string Token(std::optional<util::TimePoint> expiry) {
    entitlement::manager::v1::ActivationToken token;
    if (expiry) {
      *token.mutable_expiry() = util::ToProto(*expiry);
    }

    std::string json;
    Check(google::protobuf::util::MessageToJsonString(token, &json).ok(), "token json");
    return json;
  }

  static std::string Envelope(const std::string& token, const std::string& signature) {
    entitlement::manager::v1::ActivationCode code;
    code.set_token(token);
    code.set_signature(signature);

    std::string json;
    Check(google::protobuf::util::MessageToJsonString(code, &json).ok(), "envelope json");
    return entitlement::enterprise::EncodeBase64(json);
  }

  std::string Issue(std::optional<util::TimePoint> expiry) const {
    const auto token = Token(expiry);
    return Envelope(token, entitlement::enterprise::EncodeBase64(Sign(token)));
  }

 private:
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
};

} // namespace entitlement::testing
