#include "activation_code_validator.hpp"

#include <google/protobuf/util/json_util.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/pem.h>

#include <stdexcept>
#include <vector>

#include "entitlement/manager/v1.hpp"
#include "internal/util/errors.hpp"

namespace entitlement::enterprise {

namespace {

std::string LastOpenSslError() {
  const unsigned long err = ERR_get_error();
  if (err == 0) {
    return "unknown error";
  }
  char buf[256];
  ERR_error_string_n(err, buf, sizeof(buf));
  return buf;
}

EVP_PKEY* ParsePublicKey(const std::string& pem) {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
  if (!bio) {
    throw util::InvalidConfig("cannot allocate BIO for public key");
  }

  EVP_PKEY* key = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
  if (key == nullptr) {
    throw util::InvalidConfig("invalid activation public key: " + LastOpenSslError());
  }
  return key;
}

bool IsBase64Char(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string KeyTypeName(int key_type) {
  const char* name = OBJ_nid2sn(key_type);
  return name != nullptr ? name : "nid " + std::to_string(key_type);
}

template <typename Message>
Message ParseJson(const std::string& json, const char* what) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Message message;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw util::InvalidCode(std::string("malformed ") + what + ": " + std::string(status.message()));
  }
  return message;
}

} // namespace

std::optional<std::string> DecodeBase64(const std::string& encoded) {
  if (encoded.empty() || encoded.size() % 4 != 0) {
    return std::nullopt;
  }

  // '=' may only pad the final quantum, and never more than two characters.
  const auto first_pad = encoded.find('=');
  const auto body_end  = first_pad == std::string::npos ? encoded.size() : first_pad;
  if (encoded.size() - body_end > 2) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(encoded[i]);
    if (i >= body_end) {
      if (c != '=') return std::nullopt;
    } else if (!IsBase64Char(c)) {
      return std::nullopt;
    }
  }

  std::vector<unsigned char> out(encoded.size() / 4 * 3);
  const int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()), static_cast<int>(encoded.size()));
  if (decoded < 0) {
    return std::nullopt;
  }

  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t padding = 0;
  if (encoded[encoded.size() - 1] == '=') ++padding;
  if (encoded[encoded.size() - 2] == '=') ++padding;

  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(decoded) - padding);
}

std::string EncodeBase64(const std::string& raw) {
  if (raw.empty()) {
    return {};
  }

  std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
  const int encoded = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(raw.data()), static_cast<int>(raw.size()));
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(encoded));
}

SignedActivationCodeValidator::SignedActivationCodeValidator(const std::string& public_key_pem, util::ClockFn clock)
    : public_key_(ParsePublicKey(public_key_pem), EVP_PKEY_free), clock_(std::move(clock)) {
  const int key_type = EVP_PKEY_id(public_key_.get());
  if (key_type != EVP_PKEY_ED25519 && key_type != EVP_PKEY_RSA && key_type != EVP_PKEY_EC) {
    throw util::InvalidConfig("unsupported activation public key type: " + KeyTypeName(key_type));
  }
}

ValidatedCode SignedActivationCodeValidator::Validate(const std::string& activation_code) const {
  if (activation_code.empty()) {
    throw util::InvalidCode("activation code is empty");
  }

  const auto envelope_json = DecodeBase64(activation_code);
  if (!envelope_json) {
    throw util::InvalidCode("activation code is not valid base64");
  }

  const auto envelope = ParseJson<entitlement::manager::v1::ActivationCode>(*envelope_json, "activation code");
  if (envelope.token().empty()) {
    throw util::InvalidCode("activation code has no token");
  }
  if (envelope.signature().empty()) {
    throw util::InvalidCode("activation code has no signature");
  }

  const auto signature = DecodeBase64(envelope.signature());
  if (!signature) {
    throw util::InvalidCode("activation code signature is not valid base64");
  }
  if (!VerifySignature(envelope.token(), *signature)) {
    throw util::InvalidCode("invalid signature in activation code");
  }

  const auto token = ParseJson<entitlement::manager::v1::ActivationToken>(envelope.token(), "activation token");

  ValidatedCode result;
  if (token.has_expiry()) {
    if (!util::IsValidTimestamp(token.expiry())) {
      throw util::InvalidCode("activation code expiry is outside the valid timestamp range");
    }
    result.expires = util::FromProto(token.expiry());
    if (*result.expires <= clock_()) {
      throw util::InvalidCode("activation code expired at " + util::FormatRfc3339(*result.expires));
    }
  }
  return result;
}

bool SignedActivationCodeValidator::VerifySignature(const std::string& message, const std::string& signature) const {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("cannot allocate signature verification context");
  }

  const EVP_MD* digest = EVP_PKEY_id(public_key_.get()) == EVP_PKEY_ED25519 ? nullptr : EVP_sha256();
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, public_key_.get()) != 1) {
    throw std::runtime_error("cannot initialize signature verification: " + LastOpenSslError());
  }

  const int rc = EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char*>(signature.data()), signature.size(),
                                  reinterpret_cast<const unsigned char*>(message.data()), message.size());
  if (rc != 1) {
    // rc == 0 is a mismatch; negative values are malformed signatures. Both reject the code.
    ERR_clear_error();
    return false;
  }
  return true;
}

} // namespace entitlement::enterprise
