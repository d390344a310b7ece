#include <sharevault/schema/encoding/scale/encoder.hpp>
#include <sharevault/schema/transaction.hpp>

namespace sharevault::schema {

bytes_t make_signing_bytes(const transaction_t& tx) {
  auto unsigned_tx = tx;
  unsigned_tx.signature = ed25519_signature_t{};
  return encoding::encoder<encoding::scale_encoder_tag>{}.encode(unsigned_tx);
}

}  // namespace sharevault::schema
