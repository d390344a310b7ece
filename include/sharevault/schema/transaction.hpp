#pragma once
#include <sharevault/schema/method_call.hpp>
#include <sharevault/schema/primitives.hpp>
#include <cstdint>

namespace sharevault::schema {

/// Call envelope signed with the signer account's ed25519 key. The signature
/// covers `make_signing_bytes(tx)`; the signer's nonce must increase by
/// exactly one.
template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  account_id_t signer;
  account_id_t receiver;
  method_call_t call{};
  gas_t gas{};
  amount_t deposit{};
  ed25519_signature_t signature{};
};

using transaction_t = transaction<1>;

/// SCALE encoding of `tx` with its signature zeroed.
bytes_t make_signing_bytes(const transaction_t& tx);

}  // namespace sharevault::schema
