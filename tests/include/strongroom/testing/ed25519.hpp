#pragma once

#include <strongroom/schema/primitives.hpp>

#include <openssl/evp.h>

#include <memory>
#include <optional>

namespace strongroom::testing {

/// Throwaway ed25519 key generated with OpenSSL.
class ed25519_keypair final {
 public:
  static std::optional<ed25519_keypair> generate() {
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
      return std::nullopt;
    }
    EVP_PKEY* raw{nullptr};
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      return std::nullopt;
    }
    auto keypair = ed25519_keypair{raw};
    auto size = keypair.public_key_.size();
    if (EVP_PKEY_get_raw_public_key(raw, keypair.public_key_.data(), &size) !=
            1 ||
        size != keypair.public_key_.size()) {
      return std::nullopt;
    }
    return keypair;
  }

  const strongroom::schema::address_t& public_key() const {
    return public_key_;
  }

  strongroom::schema::ed25519_signature_t sign(
      const strongroom::schema::bytes_view_t& message) const {
    auto signature = strongroom::schema::ed25519_signature_t{};
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    auto size = signature.size();
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr,
                           key_.get()) != 1 ||
        EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                       message.size()) != 1) {
      return strongroom::schema::ed25519_signature_t{};
    }
    return signature;
  }

 private:
  explicit ed25519_keypair(EVP_PKEY* key) : key_{key, EVP_PKEY_free} {}

  std::shared_ptr<EVP_PKEY> key_;
  strongroom::schema::address_t public_key_{};
};

}  // namespace strongroom::testing
