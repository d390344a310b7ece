#pragma once
#include <sharevault/schema/component_kind.hpp>
#include <sharevault/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: account record.
// Native balance, deployed component and transaction signing key of one
// account. Accounts without a key cannot sign transactions.
namespace sharevault::schema {

template <uint16_t Version>
struct account_record;

template <>
struct account_record<1> final {
  uint16_t version{1};
  account_id_t account_id;
  amount_t balance{};
  component_kind_t kind{component_kind_t::none};
  std::optional<ed25519_public_key_t> public_key;
};

using account_record_t = account_record<1>;

}  // namespace sharevault::schema
