#pragma once
#include <sharevault/schema/primitives.hpp>

// Registry resumption for the vault provisioning batch.
namespace sharevault::schema {

template <uint16_t Version>
struct on_vault_created;

template <>
struct on_vault_created<1> final {
  uint16_t version{1};
  account_id_t origin;
};

using on_vault_created_t = on_vault_created<1>;

}  // namespace sharevault::schema
