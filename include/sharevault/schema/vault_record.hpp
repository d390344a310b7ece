#pragma once
#include <sharevault/schema/primitives.hpp>
#include <cstdint>

// Schema type: vault record.
// Immutable registry entry written once per confirmed vault provisioning.
namespace sharevault::schema {

template <uint16_t Version>
struct vault_record;

template <>
struct vault_record<1> final {
  uint16_t version{1};
  uint64_t index{};
  account_id_t origin;
  account_id_t vault_address;
};

using vault_record_t = vault_record<1>;

}  // namespace sharevault::schema
