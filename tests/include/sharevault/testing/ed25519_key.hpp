#pragma once

#include <sharevault/schema/primitives.hpp>

#include <gtest/gtest.h>
#include <openssl/evp.h>

#include <memory>
#include <optional>
#include <utility>

namespace sharevault::testing {

/// Throwaway ed25519 keypair for signing test transactions.
class ed25519_key final {
 public:
  static std::optional<ed25519_key> generate() {
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
      return std::nullopt;
    }
    auto* raw = static_cast<EVP_PKEY*>(nullptr);
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      return std::nullopt;
    }
    auto key = ed25519_key{raw};
    auto size = key.public_key_.size();
    if (EVP_PKEY_get_raw_public_key(raw, key.public_key_.data(), &size) != 1 ||
        size != key.public_key_.size()) {
      return std::nullopt;
    }
    return std::optional<ed25519_key>{std::move(key)};
  }

  const sharevault::schema::ed25519_public_key_t& public_key() const {
    return public_key_;
  }

  sharevault::schema::ed25519_signature_t sign(
      const sharevault::schema::bytes_view_t& message) const {
    auto signature = sharevault::schema::ed25519_signature_t{};
    auto size = signature.size();
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr,
                           pkey_.get()) != 1 ||
        EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                       message.size()) != 1) {
      ADD_FAILURE() << "ed25519 signing failed";
    }
    return signature;
  }

 private:
  explicit ed25519_key(EVP_PKEY* pkey) : pkey_{pkey, EVP_PKEY_free} {}

  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey_;
  sharevault::schema::ed25519_public_key_t public_key_{};
};

}  // namespace sharevault::testing
