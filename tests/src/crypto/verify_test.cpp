#include <sharevault/crypto/verify.hpp>
#include <sharevault/testing/ed25519_key.hpp>
#include <gtest/gtest.h>

#include <vector>

using sharevault::testing::ed25519_key;
namespace schema = sharevault::schema;

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!sharevault::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto key = ed25519_key::generate();
  ASSERT_TRUE(key.has_value());

  auto message = std::vector<uint8_t>{'s', 'h', 'a', 'r', 'e', 's'};
  auto signature = key->sign(schema::bytes_view_t{message});
  EXPECT_TRUE(sharevault::crypto::verify_signature(
      schema::bytes_view_t{message}, key->public_key(), signature));

  message[0] ^= 0x01;
  EXPECT_FALSE(sharevault::crypto::verify_signature(
      schema::bytes_view_t{message}, key->public_key(), signature));
}

TEST(crypto_verify, rejects_a_signature_from_another_key) {
  if (!sharevault::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto signer = ed25519_key::generate();
  auto other = ed25519_key::generate();
  ASSERT_TRUE(signer.has_value());
  ASSERT_TRUE(other.has_value());

  auto message = std::vector<uint8_t>{'v', 'a', 'u', 'l', 't'};
  auto signature = signer->sign(schema::bytes_view_t{message});
  EXPECT_FALSE(sharevault::crypto::verify_signature(
      schema::bytes_view_t{message}, other->public_key(), signature));
  EXPECT_FALSE(sharevault::crypto::verify_signature(
      schema::bytes_view_t{message}, signer->public_key(),
      schema::ed25519_signature_t{}));
}
